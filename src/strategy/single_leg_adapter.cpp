// src/strategy/single_leg_adapter.cpp
#include "options_ngin/strategy/single_leg_adapter.hpp"
#include <cmath>
#include "options_ngin/strategy/regime_classifier.hpp"

namespace options_ngin {

SingleLegConfig::SingleLegConfig() {
    exits.profit_target = 500.0;
    exits.max_loss = 250.0;
    exits.max_hold_minutes = 210.0;
}

nlohmann::json SingleLegConfig::to_json() const {
    nlohmann::json j = AdapterConfig::to_json();
    j["strike_increment"] = strike_increment;
    j["strikes_each_side"] = strikes_each_side;
    j["option_lifetime_minutes"] = option_lifetime_minutes;
    j["stop_loss_percent"] = stop_loss_percent;
    j["take_profit_percent"] = take_profit_percent;
    return j;
}

void SingleLegConfig::from_json(const nlohmann::json& j) {
    AdapterConfig::from_json(j);
    if (j.contains("strike_increment"))
        strike_increment = j.at("strike_increment").get<double>();
    if (j.contains("strikes_each_side"))
        strikes_each_side = j.at("strikes_each_side").get<int>();
    if (j.contains("option_lifetime_minutes"))
        option_lifetime_minutes = j.at("option_lifetime_minutes").get<double>();
    if (j.contains("stop_loss_percent"))
        stop_loss_percent = j.at("stop_loss_percent").get<double>();
    if (j.contains("take_profit_percent"))
        take_profit_percent = j.at("take_profit_percent").get<double>();
}

SingleLegAdapter::SingleLegAdapter(SingleLegConfig config)
    : BaseBacktestingAdapter("single_leg", config), config_(std::move(config)) {}

Result<void> SingleLegAdapter::validate_strategy() const {
    if (!(config_.strike_increment > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "single_leg: strike_increment must be positive", name());
    }
    if (config_.strikes_each_side < 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "single_leg: strikes_each_side must not be negative", name());
    }
    if (!(config_.option_lifetime_minutes > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "single_leg: option_lifetime_minutes must be positive", name());
    }
    if (config_.stop_loss_percent < 0.0 || config_.take_profit_percent < 0.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "single_leg: stop and target percents must not be negative",
                                name());
    }
    return Result<void>();
}

double SingleLegAdapter::at_the_money(double underlying_price) const {
    return std::round(underlying_price / config_.strike_increment) * config_.strike_increment;
}

Timestamp SingleLegAdapter::expiry_from(const Timestamp& time) const {
    return time + std::chrono::duration_cast<Timestamp::duration>(
                      std::chrono::duration<double, std::ratio<60>>(
                          config_.option_lifetime_minutes));
}

std::vector<OptionContract> SingleLegAdapter::required_contracts(double underlying_price,
                                                                 const Timestamp& time) const {
    std::vector<OptionContract> contracts;
    double atm = at_the_money(underlying_price);
    Timestamp expiry = expiry_from(time);

    for (int i = -config_.strikes_each_side; i <= config_.strikes_each_side; ++i) {
        double strike = atm + i * config_.strike_increment;
        contracts.emplace_back(OptionType::CALL, strike, expiry);
        contracts.emplace_back(OptionType::PUT, strike, expiry);
    }
    return contracts;
}

bool SingleLegAdapter::accepts_signal(const Signal& signal) const {
    return BaseBacktestingAdapter::accepts_signal(signal) && signal.direction.has_value();
}

Result<Position> SingleLegAdapter::build_position(const Signal& signal,
                                                  const std::vector<OptionQuote>& quotes,
                                                  double underlying_price) {
    if (!accepts_signal(signal)) {
        return make_error<Position>(ErrorCode::INVALID_SIGNAL,
                                    "Signal is not an actionable directional entry", name());
    }

    double strike = signal.target_strike ? *signal.target_strike : at_the_money(underlying_price);

    LegRequest request;
    request.contract = OptionContract(*signal.direction, strike, expiry_from(signal.timestamp));
    request.side = LegSide::LONG;
    request.quantity = signal.target_contracts;

    PositionMetadata metadata;
    metadata.regime = regime_label_for(signal);
    metadata.volatility_index = signal.indicators.volatility_index;
    metadata.profit_zone_width = signal.indicators.profit_zone_width;
    metadata.direction = signal.direction;

    auto result = assemble_position(signal, {request}, quotes, underlying_price, metadata);
    if (result.is_error()) {
        return result;
    }

    Position position = result.take_value();
    double premium = position.entry_cost;

    if (signal.take_profit) {
        position.metadata.profit_target = *signal.take_profit;
    } else if (config_.take_profit_percent > 0.0) {
        position.metadata.profit_target = premium * config_.take_profit_percent / 100.0;
    } else {
        position.metadata.profit_target = config_.exits.profit_target;
    }

    if (signal.stop_loss) {
        position.metadata.max_loss = *signal.stop_loss;
    } else if (config_.stop_loss_percent > 0.0) {
        position.metadata.max_loss = premium * config_.stop_loss_percent / 100.0;
    } else {
        position.metadata.max_loss = config_.exits.max_loss;
    }

    INFO("Opened " << position.id << " " << position.legs.front().contract.to_string() << " x"
                   << request.quantity << " for " << premium << " (target "
                   << position.metadata.profit_target << ", stop " << position.metadata.max_loss
                   << ")");
    return position;
}

void SingleLegAdapter::add_strategy_metrics(const std::vector<Trade>& trades,
                                            const std::vector<Signal>& /*signals*/,
                                            StrategyMetrics& metrics) const {
    int calls = 0, call_wins = 0, puts = 0, put_wins = 0;
    double holding = 0.0;

    for (const auto& trade : trades) {
        holding += trade.holding_minutes;
        if (!trade.direction) {
            continue;
        }
        if (*trade.direction == OptionType::CALL) {
            ++calls;
            call_wins += trade.is_win() ? 1 : 0;
        } else {
            ++puts;
            put_wins += trade.is_win() ? 1 : 0;
        }
    }

    metrics["call_trades"] = calls;
    metrics["put_trades"] = puts;
    metrics["call_win_rate"] = calls > 0 ? static_cast<double>(call_wins) / calls : 0.0;
    metrics["put_win_rate"] = puts > 0 ? static_cast<double>(put_wins) / puts : 0.0;
    metrics["avg_holding_minutes"] = trades.empty() ? 0.0 : holding / trades.size();
}

}  // namespace options_ngin
