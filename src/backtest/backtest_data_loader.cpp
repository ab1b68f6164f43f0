// src/backtest/backtest_data_loader.cpp
#include "options_ngin/backtest/backtest_data_loader.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <random>
#include <sstream>
#include "options_ngin/core/logger.hpp"
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {
namespace backtest {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

template <typename T>
Result<T> bad_row(const std::string& path, size_t line_no, const std::string& what) {
    return make_error<T>(ErrorCode::INVALID_DATA,
                         path + ":" + std::to_string(line_no) + ": " + what,
                         "BacktestDataLoader");
}

}  // namespace

BacktestDataLoader::BacktestDataLoader() {
    Logger::register_component("BacktestDataLoader");
}

std::vector<std::string> BacktestDataLoader::split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

bool BacktestDataLoader::parse_double(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        out = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

Result<std::vector<Bar>> BacktestDataLoader::load_bars_csv(const std::string& path,
                                                           const std::string& symbol) const {
    using BarsResult = std::vector<Bar>;

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<BarsResult>(ErrorCode::FILE_NOT_FOUND, "Cannot open bar file " + path,
                                      "BacktestDataLoader");
    }

    std::vector<Bar> bars;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line_no == 1 || trim(line).empty()) {
            continue;  // header or blank
        }

        auto fields = split_csv_line(line);
        if (fields.size() < 6) {
            return bad_row<BarsResult>(path, line_no, "expected 6 fields");
        }

        auto ts = core::parse_timestamp(fields[0]);
        if (!ts) {
            return bad_row<BarsResult>(path, line_no, "bad timestamp '" + fields[0] + "'");
        }

        double values[5];
        for (size_t i = 0; i < 5; ++i) {
            if (!parse_double(fields[i + 1], values[i])) {
                return bad_row<BarsResult>(path, line_no, "bad number '" + fields[i + 1] + "'");
            }
        }
        bars.emplace_back(*ts, values[0], values[1], values[2], values[3], values[4], symbol);
    }

    INFO("Loaded " << bars.size() << " bars for " << symbol << " from " << path);
    return bars;
}

Result<std::vector<std::pair<Timestamp, OptionQuote>>> BacktestDataLoader::load_quotes_csv(
    const std::string& path) const {
    using QuotesResult = std::vector<std::pair<Timestamp, OptionQuote>>;

    std::ifstream file(path);
    if (!file.is_open()) {
        return make_error<QuotesResult>(ErrorCode::FILE_NOT_FOUND,
                                        "Cannot open quote file " + path, "BacktestDataLoader");
    }

    QuotesResult quotes;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line_no == 1 || trim(line).empty()) {
            continue;
        }

        auto fields = split_csv_line(line);
        if (fields.size() < 10) {
            return bad_row<QuotesResult>(path, line_no, "expected 10 fields");
        }

        auto ts = core::parse_timestamp(fields[0]);
        auto expiration = core::parse_timestamp(fields[3]);
        if (!ts || !expiration) {
            return bad_row<QuotesResult>(path, line_no, "bad timestamp or expiration");
        }
        auto type = option_type_from_string(fields[1]);
        if (!type) {
            return bad_row<QuotesResult>(path, line_no, "bad option type '" + fields[1] + "'");
        }

        OptionQuote quote;
        quote.type = *type;
        quote.expiration = *expiration;

        struct NumericField {
            size_t column;
            double* target;
            bool optional;
        };
        const NumericField numeric[] = {{2, &quote.strike, false},
                                        {4, &quote.bid, false},
                                        {5, &quote.ask, false},
                                        {6, &quote.last, false},
                                        {7, &quote.volume, false},
                                        {8, &quote.open_interest, false},
                                        {9, &quote.implied_volatility, true}};
        for (const auto& field : numeric) {
            const std::string& text = fields[field.column];
            if (field.optional && text.empty()) {
                continue;
            }
            if (!parse_double(text, *field.target)) {
                return bad_row<QuotesResult>(path, line_no, "bad number '" + text + "' in column " +
                                                                std::to_string(field.column + 1));
            }
        }
        quotes.emplace_back(*ts, quote);
    }

    INFO("Loaded " << quotes.size() << " option quotes from " << path);
    return quotes;
}

std::vector<Bar> BacktestDataLoader::generate_synthetic_bars(
    const SyntheticPathConfig& config) const {
    std::vector<Bar> bars;
    bars.reserve(config.bars);

    std::mt19937_64 rng(config.seed);
    std::normal_distribution<double> shock(0.0, 1.0);

    double dt = config.interval_minutes / (MINUTES_PER_DAY * DAYS_PER_YEAR);
    double drift = (config.annual_drift - 0.5 * config.annual_volatility *
                                              config.annual_volatility) * dt;
    double diffusion = config.annual_volatility * std::sqrt(dt);

    double price = config.start_price;
    for (size_t i = 0; i < config.bars; ++i) {
        double open = price;
        double close = open * std::exp(drift + diffusion * shock(rng));
        double wiggle = std::abs(close - open) * 0.25;
        double high = std::max(open, close) + wiggle;
        double low = std::max(0.01, std::min(open, close) - wiggle);

        Timestamp ts = config.start + std::chrono::minutes(config.interval_minutes * i);
        bars.emplace_back(ts, open, high, low, close, 0.0, config.symbol);
        price = close;
    }
    return bars;
}

}  // namespace backtest
}  // namespace options_ngin
