// src/instruments/option.cpp
#include "options_ngin/instruments/option.hpp"
#include <cmath>
#include <sstream>
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {

namespace {
constexpr double STRIKE_EPSILON = 1e-6;

double expiration_gap_days(const Timestamp& a, const Timestamp& b) {
    return std::abs(minutes_between(a, b)) / MINUTES_PER_DAY;
}
}  // namespace

std::string option_type_to_string(OptionType type) {
    return type == OptionType::CALL ? "CALL" : "PUT";
}

std::optional<OptionType> option_type_from_string(const std::string& text) {
    if (text == "CALL" || text == "call" || text == "C" || text == "c")
        return OptionType::CALL;
    if (text == "PUT" || text == "put" || text == "P" || text == "p")
        return OptionType::PUT;
    return std::nullopt;
}

std::string leg_side_to_string(LegSide side) {
    return side == LegSide::LONG ? "LONG" : "SHORT";
}

bool OptionContract::matches(const OptionContract& other, double tolerance_days) const {
    return type == other.type && std::abs(strike - other.strike) < STRIKE_EPSILON &&
           expiration_gap_days(expiration, other.expiration) <= tolerance_days;
}

bool OptionContract::operator<(const OptionContract& other) const {
    if (expiration != other.expiration)
        return expiration < other.expiration;
    if (type != other.type)
        return type < other.type;
    return strike < other.strike;
}

std::string OptionContract::to_string() const {
    std::ostringstream ss;
    ss << option_type_to_string(type) << " " << strike << " "
       << core::format_timestamp(expiration).substr(0, 10);
    return ss.str();
}

const OptionQuote* find_quote(const std::vector<OptionQuote>& quotes,
                              const OptionContract& contract, double tolerance_days) {
    const OptionQuote* best = nullptr;
    double best_gap = 0.0;

    for (const auto& quote : quotes) {
        if (!contract.matches(quote.contract(), tolerance_days)) {
            continue;
        }
        double gap = expiration_gap_days(contract.expiration, quote.expiration);
        if (!best || gap < best_gap) {
            best = &quote;
            best_gap = gap;
        }
    }
    return best;
}

}  // namespace options_ngin
