// src/strategy/flyagonal_adapter.cpp
#include "options_ngin/strategy/flyagonal_adapter.hpp"
#include <cmath>
#include "options_ngin/strategy/regime_classifier.hpp"

namespace options_ngin {

namespace {
Timestamp add_days(const Timestamp& time, int days) {
    return time + std::chrono::hours(24 * days);
}
}  // namespace

FlyagonalConfig::FlyagonalConfig() {
    exits.profit_target = 750.0;
    exits.max_loss = 500.0;
    exits.target_hold_minutes = 4.5 * MINUTES_PER_DAY;
    exits.max_hold_minutes = 7.0 * MINUTES_PER_DAY;
}

nlohmann::json FlyagonalConfig::to_json() const {
    nlohmann::json j = AdapterConfig::to_json();
    j["strike_rounding"] = strike_rounding;
    j["call_entry_offset"] = call_entry_offset;
    j["short_call_width"] = short_call_width;
    j["upper_call_width"] = upper_call_width;
    j["diagonal_percent_below"] = diagonal_percent_below;
    j["diagonal_rounding"] = diagonal_rounding;
    j["diagonal_protection_width"] = diagonal_protection_width;
    j["short_expiry_days"] = short_expiry_days;
    j["long_expiry_days"] = long_expiry_days;
    j["profit_zone_threshold"] = profit_zone_threshold;
    return j;
}

void FlyagonalConfig::from_json(const nlohmann::json& j) {
    AdapterConfig::from_json(j);
    if (j.contains("strike_rounding"))
        strike_rounding = j.at("strike_rounding").get<double>();
    if (j.contains("call_entry_offset"))
        call_entry_offset = j.at("call_entry_offset").get<double>();
    if (j.contains("short_call_width"))
        short_call_width = j.at("short_call_width").get<double>();
    if (j.contains("upper_call_width"))
        upper_call_width = j.at("upper_call_width").get<double>();
    if (j.contains("diagonal_percent_below"))
        diagonal_percent_below = j.at("diagonal_percent_below").get<double>();
    if (j.contains("diagonal_rounding"))
        diagonal_rounding = j.at("diagonal_rounding").get<double>();
    if (j.contains("diagonal_protection_width"))
        diagonal_protection_width = j.at("diagonal_protection_width").get<double>();
    if (j.contains("short_expiry_days"))
        short_expiry_days = j.at("short_expiry_days").get<int>();
    if (j.contains("long_expiry_days"))
        long_expiry_days = j.at("long_expiry_days").get<int>();
    if (j.contains("profit_zone_threshold"))
        profit_zone_threshold = j.at("profit_zone_threshold").get<double>();
}

FlyagonalAdapter::FlyagonalAdapter(FlyagonalConfig config)
    : BaseBacktestingAdapter("flyagonal", config), config_(std::move(config)) {}

Result<void> FlyagonalAdapter::validate_strategy() const {
    if (!(config_.strike_rounding > 0.0) || !(config_.diagonal_rounding > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "flyagonal: strike rounding must be positive", name());
    }
    if (!(config_.short_call_width > 0.0) || !(config_.upper_call_width > 0.0) ||
        !(config_.diagonal_protection_width > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "flyagonal: wing widths must be positive", name());
    }
    if (config_.diagonal_percent_below < 0.0 || config_.diagonal_percent_below >= 100.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "flyagonal: diagonal_percent_below must be within [0, 100)",
                                name());
    }
    if (config_.short_expiry_days <= 0 || config_.long_expiry_days <= config_.short_expiry_days) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "flyagonal: expiries must satisfy 0 < short < long", name());
    }
    return Result<void>();
}

FlyagonalLayout FlyagonalAdapter::layout(double underlying_price, const Timestamp& time) const {
    FlyagonalLayout out;

    double base = std::ceil(underlying_price / config_.strike_rounding) * config_.strike_rounding;
    out.lower_call = base + config_.call_entry_offset;
    out.short_call = out.lower_call + config_.short_call_width;
    out.upper_call = out.short_call + config_.upper_call_width;

    double below = underlying_price * (1.0 - config_.diagonal_percent_below / 100.0);
    out.short_put = std::floor(below / config_.diagonal_rounding) * config_.diagonal_rounding;
    out.long_put = out.short_put - config_.diagonal_protection_width;

    out.short_expiry = add_days(time, config_.short_expiry_days);
    out.long_expiry = add_days(time, config_.long_expiry_days);
    return out;
}

std::vector<OptionContract> FlyagonalAdapter::required_contracts(double underlying_price,
                                                                 const Timestamp& time) const {
    FlyagonalLayout l = layout(underlying_price, time);
    return {OptionContract(OptionType::CALL, l.lower_call, l.short_expiry),
            OptionContract(OptionType::CALL, l.short_call, l.short_expiry),
            OptionContract(OptionType::CALL, l.upper_call, l.short_expiry),
            OptionContract(OptionType::PUT, l.short_put, l.short_expiry),
            OptionContract(OptionType::PUT, l.long_put, l.long_expiry)};
}

Result<Position> FlyagonalAdapter::build_position(const Signal& signal,
                                                  const std::vector<OptionQuote>& quotes,
                                                  double underlying_price) {
    if (!accepts_signal(signal)) {
        return make_error<Position>(ErrorCode::INVALID_SIGNAL,
                                    "Signal is not an actionable entry", name());
    }

    int n = signal.target_contracts;
    FlyagonalLayout l = layout(underlying_price, signal.timestamp);

    std::vector<LegRequest> requests = {
        {OptionContract(OptionType::CALL, l.lower_call, l.short_expiry), LegSide::LONG, n},
        {OptionContract(OptionType::CALL, l.short_call, l.short_expiry), LegSide::SHORT, 2 * n},
        {OptionContract(OptionType::CALL, l.upper_call, l.short_expiry), LegSide::LONG, n},
        {OptionContract(OptionType::PUT, l.short_put, l.short_expiry), LegSide::SHORT, n},
        {OptionContract(OptionType::PUT, l.long_put, l.long_expiry), LegSide::LONG, n}};

    PositionMetadata metadata;
    metadata.regime = regime_label_for(signal);
    metadata.volatility_index = signal.indicators.volatility_index;
    metadata.profit_zone_width = signal.indicators.profit_zone_width;
    metadata.profit_target =
        signal.take_profit ? *signal.take_profit : config_.exits.profit_target;
    metadata.max_loss = signal.stop_loss ? *signal.stop_loss : config_.exits.max_loss;

    auto result = assemble_position(signal, requests, quotes, underlying_price, metadata);
    if (result.is_error()) {
        return result;
    }

    const Position& position = result.value();
    INFO("Opened " << position.id << " at " << underlying_price << ": calls " << l.lower_call
                   << "/" << l.short_call << "/" << l.upper_call << ", puts " << l.short_put
                   << "/" << l.long_put << ", entry cost " << position.entry_cost << ", regime "
                   << position.metadata.regime);
    return result;
}

void FlyagonalAdapter::add_strategy_metrics(const std::vector<Trade>& trades,
                                            const std::vector<Signal>& signals,
                                            StrategyMetrics& metrics) const {
    double holding_days = 0.0;
    for (const auto& trade : trades) {
        holding_days += trade.holding_minutes / MINUTES_PER_DAY;
    }
    metrics["avg_holding_days"] = trades.empty() ? 0.0 : holding_days / trades.size();

    int with_width = 0;
    int wide = 0;
    double width_sum = 0.0;
    for (const auto& signal : signals) {
        if (!signal.indicators.profit_zone_width) {
            continue;
        }
        ++with_width;
        width_sum += *signal.indicators.profit_zone_width;
        if (*signal.indicators.profit_zone_width >= config_.profit_zone_threshold) {
            ++wide;
        }
    }
    metrics["profit_zone_efficiency"] =
        with_width > 0 ? static_cast<double>(wide) / with_width : 0.0;
    metrics["avg_profit_zone_width"] = with_width > 0 ? width_sum / with_width : 0.0;
}

}  // namespace options_ngin
