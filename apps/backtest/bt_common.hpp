// apps/backtest/bt_common.hpp
#pragma once

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "options_ngin/backtest/backtest_csv_exporter.hpp"
#include "options_ngin/backtest/backtest_data_loader.hpp"
#include "options_ngin/backtest/backtest_engine.hpp"
#include "options_ngin/core/logger.hpp"
#include "options_ngin/core/time_utils.hpp"
#include "options_ngin/data/signal_generator.hpp"
#include "options_ngin/data/synthetic_quote_provider.hpp"

namespace options_ngin {
namespace apps {

/**
 * @brief Read the optional JSON config named on the command line
 */
inline Result<nlohmann::json> load_app_config(int argc, char* argv[]) {
    if (argc < 2) {
        return nlohmann::json::object();
    }
    try {
        std::ifstream file(argv[1]);
        if (!file.is_open()) {
            return make_error<nlohmann::json>(ErrorCode::FILE_NOT_FOUND,
                                              std::string("Cannot open config ") + argv[1],
                                              "bt_app");
        }
        nlohmann::json j;
        file >> j;
        return j;
    } catch (const std::exception& e) {
        return make_error<nlohmann::json>(ErrorCode::JSON_PARSE_ERROR,
                                          std::string("Bad config: ") + e.what(), "bt_app");
    }
}

inline nlohmann::json section(const nlohmann::json& j, const std::string& key) {
    return j.contains(key) ? j.at(key) : nlohmann::json::object();
}

inline bool initialize_logger(const nlohmann::json& app_config, const std::string& prefix) {
    Logger::reset_for_tests();

    LoggerConfig logger_config;
    logger_config.min_level = LogLevel::INFO;
    logger_config.destination = LogDestination::BOTH;
    logger_config.filename_prefix = prefix;
    logger_config.from_json(section(app_config, "logger"));

    try {
        Logger::instance().initialize(logger_config);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Logger initialization failed: " << e.what() << std::endl;
        return false;
    }
    return Logger::instance().is_initialized();
}

/**
 * @brief Bars from data.bars_csv, or a generated path when none is given
 */
inline Result<std::vector<Bar>> load_bars(const nlohmann::json& app_config,
                                          const std::string& symbol) {
    backtest::BacktestDataLoader loader;
    nlohmann::json data = section(app_config, "data");

    if (data.contains("bars_csv")) {
        return loader.load_bars_csv(data.at("bars_csv").get<std::string>(), symbol);
    }

    backtest::SyntheticPathConfig path;
    path.symbol = symbol;
    path.start = core::parse_timestamp("2025-01-06 14:30:00").value_or(Timestamp{});
    if (data.contains("start")) {
        auto start = core::parse_timestamp(data.at("start").get<std::string>());
        if (!start) {
            return make_error<std::vector<Bar>>(ErrorCode::CONFIGURATION_ERROR,
                                                "data.start is not a valid timestamp", "bt_app");
        }
        path.start = *start;
    }
    if (data.contains("bars"))
        path.bars = data.at("bars").get<size_t>();
    if (data.contains("interval_minutes"))
        path.interval_minutes = data.at("interval_minutes").get<int>();
    if (data.contains("start_price"))
        path.start_price = data.at("start_price").get<double>();
    if (data.contains("annual_volatility"))
        path.annual_volatility = data.at("annual_volatility").get<double>();
    if (data.contains("seed"))
        path.seed = data.at("seed").get<uint64_t>();

    INFO("Generating " << path.bars << " synthetic bars for " << symbol);
    return loader.generate_synthetic_bars(path);
}

inline SyntheticQuoteConfig quote_config(const nlohmann::json& app_config) {
    SyntheticQuoteConfig config;
    nlohmann::json q = section(app_config, "quotes");
    if (q.contains("volatility"))
        config.volatility = q.at("volatility").get<double>();
    if (q.contains("risk_free_rate"))
        config.risk_free_rate = q.at("risk_free_rate").get<double>();
    if (q.contains("half_spread_percent"))
        config.half_spread_percent = q.at("half_spread_percent").get<double>();
    return config;
}

/**
 * @brief Annualized realized volatility of recent closes, in index points
 */
inline std::optional<double> realized_vol_index(const std::vector<Bar>& history, size_t lookback,
                                                double periods_per_year) {
    if (history.size() < lookback + 1) {
        return std::nullopt;
    }
    std::vector<double> returns;
    for (size_t i = history.size() - lookback; i < history.size(); ++i) {
        returns.push_back(std::log(history[i].close / history[i - 1].close));
    }
    double mean = 0.0;
    for (double r : returns)
        mean += r;
    mean /= returns.size();
    double var = 0.0;
    for (double r : returns)
        var += (r - mean) * (r - mean);
    var /= (returns.size() - 1);
    return std::sqrt(var * periods_per_year) * 100.0;
}

inline void print_summary(const backtest::BacktestResults& results) {
    const auto& s = results.summary;
    std::cout << "\n======= " << results.strategy << " backtest =======" << std::endl;
    if (results.simulated) {
        std::cout << "SIMULATION MODE: missing quotes valued with seeded noise" << std::endl;
    }
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Bars processed:     " << results.bars_processed << std::endl;
    std::cout << "Trades:             " << s.total_trades << " (" << s.winning_trades << " won, "
              << s.losing_trades << " lost)" << std::endl;
    std::cout << "Win rate:           " << s.win_rate * 100.0 << "%" << std::endl;
    std::cout << "Total P&L:          $" << s.total_pnl << std::endl;
    std::cout << "Commission paid:    $" << s.total_commission << std::endl;
    std::cout << "Avg P&L per trade:  $" << s.avg_pnl << std::endl;
    std::cout << "Max drawdown:       $" << s.max_drawdown << " (" << s.max_drawdown_pct * 100.0
              << "%)" << std::endl;
    std::cout << "Sharpe / Sortino:   " << s.sharpe_ratio << " / " << s.sortino_ratio
              << std::endl;
    std::cout << "Signal efficiency:  " << s.signal_efficiency * 100.0 << "%" << std::endl;
    std::cout << "Data gaps:          " << results.data_gaps << std::endl;

    std::cout << "\nRegime               Trades   Win rate    Avg P&L" << std::endl;
    for (const auto& [regime, stats] : s.regimes) {
        std::cout << std::left << std::setw(20) << regime << std::right << std::setw(8)
                  << stats.trades << std::setw(10) << stats.win_rate * 100.0 << "%"
                  << std::setw(11) << stats.avg_pnl << std::endl;
    }

    std::cout << "\nStrategy metrics" << std::endl;
    for (const auto& [name, value] : results.strategy_metrics) {
        std::cout << "  " << std::left << std::setw(28) << name << std::right << value
                  << std::endl;
    }
}

/**
 * @brief Run, print and export; returns the process exit code
 */
inline int run_and_report(backtest::BacktestEngine& engine, const std::vector<Bar>& bars) {
    auto result = engine.run(bars);
    if (result.is_error()) {
        std::cerr << "Backtest failed: " << result.error()->to_string() << std::endl;
        std::cerr << "Partial ledger: " << engine.state().ledger.size() << " closed trades, "
                  << engine.state().open_positions.size() << " open positions" << std::endl;
        return 1;
    }

    const auto& results = result.value();
    print_summary(results);

    if (engine.config().store_trade_details) {
        backtest::BacktestCSVExporter exporter(engine.config().output_directory);
        auto exported = exporter.export_results(results);
        if (exported.is_error()) {
            std::cerr << "Export failed: " << exported.error()->what() << std::endl;
            return 1;
        }
        std::cout << "\nResults written to " << engine.config().output_directory << std::endl;
    }
    return 0;
}

}  // namespace apps
}  // namespace options_ngin
