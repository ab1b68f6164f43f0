// src/strategy/base_backtesting_adapter.cpp
#include "options_ngin/strategy/base_backtesting_adapter.hpp"
#include <cmath>
#include <set>
#include <unordered_map>
#include "options_ngin/strategy/regime_classifier.hpp"

namespace options_ngin {

namespace {

ValuationParams valuation_params(const AdapterConfig& config) {
    ValuationParams params;
    params.expiration_tolerance_days = config.expiration_tolerance_days;
    params.estimation_volatility = config.estimation_volatility;
    params.risk_free_rate = config.risk_free_rate;
    return params;
}

std::string fill_model_to_string(FillModel model) {
    return model == FillModel::CROSS_SPREAD ? "CROSS_SPREAD" : "MARK";
}

}  // namespace

std::string valuation_mode_to_string(ValuationMode mode) {
    return mode == ValuationMode::SEEDED_RANDOM ? "SEEDED_RANDOM" : "DETERMINISTIC";
}

nlohmann::json AdapterConfig::to_json() const {
    nlohmann::json j;
    j["underlying_symbol"] = underlying_symbol;
    j["exits"] = exits.to_json();
    j["min_confidence"] = min_confidence;
    j["contract_multiplier"] = contract_multiplier;
    j["expiration_tolerance_days"] = expiration_tolerance_days;
    j["estimation_volatility"] = estimation_volatility;
    j["risk_free_rate"] = risk_free_rate;
    j["fill_model"] = fill_model_to_string(fill_model);
    j["slippage_percent"] = slippage_percent;
    j["version"] = version;
    return j;
}

void AdapterConfig::from_json(const nlohmann::json& j) {
    if (j.contains("underlying_symbol"))
        underlying_symbol = j.at("underlying_symbol").get<std::string>();
    if (j.contains("exits"))
        exits.from_json(j.at("exits"));
    if (j.contains("min_confidence"))
        min_confidence = j.at("min_confidence").get<double>();
    if (j.contains("contract_multiplier"))
        contract_multiplier = j.at("contract_multiplier").get<double>();
    if (j.contains("expiration_tolerance_days"))
        expiration_tolerance_days = j.at("expiration_tolerance_days").get<double>();
    if (j.contains("estimation_volatility"))
        estimation_volatility = j.at("estimation_volatility").get<double>();
    if (j.contains("risk_free_rate"))
        risk_free_rate = j.at("risk_free_rate").get<double>();
    if (j.contains("fill_model")) {
        std::string model = j.at("fill_model").get<std::string>();
        fill_model = model == "CROSS_SPREAD" ? FillModel::CROSS_SPREAD : FillModel::MARK;
    }
    if (j.contains("slippage_percent"))
        slippage_percent = j.at("slippage_percent").get<double>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

BaseBacktestingAdapter::BaseBacktestingAdapter(std::string name, const AdapterConfig& config)
    : valuer_(valuation_params(config)), name_(std::move(name)), config_(config) {
    Logger::register_component("BacktestingAdapter");
}

Result<void> BaseBacktestingAdapter::validate() const {
    auto exits_result = config_.exits.validate();
    if (exits_result.is_error()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                name_ + ": " + exits_result.error()->what(), name_);
    }
    if (!(config_.contract_multiplier > 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                name_ + ": contract_multiplier must be positive", name_);
    }
    if (!(config_.expiration_tolerance_days >= 0.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                name_ + ": expiration_tolerance_days must not be negative", name_);
    }
    if (!(config_.estimation_volatility > 0.0) || !std::isfinite(config_.estimation_volatility)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                name_ + ": estimation_volatility must be positive", name_);
    }
    if (!(config_.slippage_percent >= 0.0) || !(config_.slippage_percent < 100.0)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                name_ + ": slippage_percent must be within [0, 100)", name_);
    }
    if (config_.underlying_symbol.empty()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                name_ + ": underlying_symbol must be set", name_);
    }
    if (config_.min_confidence < 0.0 || config_.min_confidence > 100.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                name_ + ": min_confidence must be within [0, 100]", name_);
    }
    return validate_strategy();
}

void BaseBacktestingAdapter::set_valuation_mode(ValuationMode mode, uint64_t seed) {
    valuation_mode_ = mode;
    rng_.seed(seed);
    noise_.reset();
    if (mode == ValuationMode::SEEDED_RANDOM) {
        WARN(name_ << ": legs without quotes will be valued with seeded random noise (seed "
                   << seed << ")");
    }
}

bool BaseBacktestingAdapter::accepts_signal(const Signal& signal) const {
    return signal.action == SignalAction::ENTER && signal.target_contracts > 0 &&
           signal.confidence >= config_.min_confidence;
}

double BaseBacktestingAdapter::fill_price(const OptionQuote& quote, LegSide side) const {
    double price = quote.mark_price();
    if (config_.fill_model == FillModel::CROSS_SPREAD) {
        double touch = side == LegSide::LONG ? quote.ask : quote.bid;
        if (touch > 0.0) {
            price = touch;
        }
    }
    if (config_.slippage_percent > 0.0) {
        double slip = config_.slippage_percent / 100.0;
        price *= side == LegSide::LONG ? 1.0 + slip : 1.0 - slip;
    }
    return price;
}

Result<Position> BaseBacktestingAdapter::assemble_position(const Signal& signal,
                                                           const std::vector<LegRequest>& requests,
                                                           const std::vector<OptionQuote>& quotes,
                                                           double underlying_price,
                                                           PositionMetadata metadata) {
    std::vector<PositionLeg> legs;
    legs.reserve(requests.size());

    for (const auto& request : requests) {
        const OptionQuote* quote =
            find_quote(quotes, request.contract, config_.expiration_tolerance_days);
        if (!quote) {
            return make_error<Position>(ErrorCode::DATA_GAP,
                                        "No quote for leg " + request.contract.to_string(), name_);
        }

        double price = fill_price(*quote, request.side);
        if (!std::isfinite(price) || price <= 0.0) {
            return make_error<Position>(ErrorCode::DATA_GAP,
                                        "Quote for leg " + request.contract.to_string() +
                                            " has no usable price",
                                        name_);
        }

        // Keep the listed expiration so later marks find the same quote
        legs.emplace_back(quote->contract(), request.side, request.quantity, price);
    }

    metadata.strategy = name_;
    metadata.entry_underlying = underlying_price;

    std::string id = name_ + "-" + std::to_string(next_position_id_);
    auto result = open_position(id, config_.underlying_symbol, std::move(legs), signal.timestamp,
                                config_.contract_multiplier, std::move(metadata));
    if (result.is_error()) {
        return result;
    }
    ++next_position_id_;

    Position position = result.take_value();
    position.entry_greeks =
        valuer_.position_greeks(position, underlying_price, position.entry_time, quotes);
    position.greeks = position.entry_greeks;
    return position;
}

Position BaseBacktestingAdapter::update_position(const Position& position, const Bar& bar,
                                                 const std::vector<OptionQuote>& quotes) {
    Position updated = position;

    std::function<double(double)> adjust;
    if (valuation_mode_ == ValuationMode::SEEDED_RANDOM) {
        adjust = [this](double price) { return price * std::exp(noise_(rng_)); };
    }

    size_t estimated = valuer_.mark_to_market(updated, quotes, bar.close, bar.timestamp, adjust);
    updated.greeks = valuer_.position_greeks(updated, bar.close, bar.timestamp, quotes);
    if (estimated > 0) {
        DEBUG(updated.id << ": " << estimated << " of " << updated.legs.size()
                         << " legs estimated at " << bar.close);
    }
    return updated;
}

std::optional<ExitReason> BaseBacktestingAdapter::should_exit(
    const Position& position, const Bar& /*bar*/, const std::vector<OptionQuote>& /*quotes*/,
    double holding_minutes) const {
    ExitThresholds thresholds = config_.exits;
    if (position.metadata.profit_target > 0.0) {
        thresholds.profit_target = position.metadata.profit_target;
    }
    if (position.metadata.max_loss > 0.0) {
        thresholds.max_loss = position.metadata.max_loss;
    }
    return evaluate_exit(thresholds, position.unrealized_pnl, holding_minutes);
}

StrategyMetrics BaseBacktestingAdapter::strategy_metrics(const std::vector<Trade>& trades,
                                                         const std::vector<Signal>& signals) const {
    StrategyMetrics metrics;

    std::unordered_map<std::string, std::pair<int, int>> by_regime;  // trades, wins
    for (const auto& trade : trades) {
        auto& counts = by_regime[trade.regime];
        ++counts.first;
        if (trade.is_win()) {
            ++counts.second;
        }
    }
    for (const auto& [regime, counts] : by_regime) {
        metrics["trades_" + regime] = counts.first;
        metrics["win_rate_" + regime] =
            counts.first > 0 ? static_cast<double>(counts.second) / counts.first : 0.0;
    }

    size_t qualifying = 0;
    for (const auto& signal : signals) {
        if (accepts_signal(signal)) {
            ++qualifying;
        }
    }
    std::set<size_t> profitable;
    for (const auto& trade : trades) {
        if (trade.is_win()) {
            profitable.insert(trade.signal_index);
        }
    }

    metrics["total_signals"] = static_cast<double>(signals.size());
    metrics["qualifying_signals"] = static_cast<double>(qualifying);
    metrics["profitable_signals"] = static_cast<double>(profitable.size());
    metrics["signal_efficiency"] =
        qualifying > 0 ? static_cast<double>(profitable.size()) / qualifying : 0.0;

    add_strategy_metrics(trades, signals, metrics);
    return metrics;
}

}  // namespace options_ngin
