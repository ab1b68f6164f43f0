// src/backtest/backtest_engine.cpp
#include "options_ngin/backtest/backtest_engine.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include "options_ngin/core/logger.hpp"
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {
namespace backtest {

namespace {

bool finite_positive(double x) {
    return std::isfinite(x) && x > 0.0;
}

Trade to_trade(const Position& position, const Timestamp& exit_time, ExitReason reason,
               double exit_commission) {
    Trade trade;
    trade.position_id = position.id;
    trade.strategy = position.metadata.strategy;
    trade.entry_time = position.entry_time;
    trade.exit_time = exit_time;
    trade.entry_cost = position.entry_cost;
    trade.exit_value = position.current_value;
    trade.commission = position.commission + exit_commission;
    trade.realized_pnl = position.current_value - position.entry_cost - trade.commission;
    trade.holding_minutes = position.holding_minutes(exit_time);
    trade.exit_reason = reason;
    trade.regime = position.metadata.regime;
    trade.leg_count = position.legs.size();
    trade.estimated = position.estimated;
    trade.signal_index = position.metadata.signal_index;
    trade.peak_pnl = position.peak_pnl;
    trade.trough_pnl = position.trough_pnl;
    trade.direction = position.metadata.direction;
    trade.profit_zone_width = position.metadata.profit_zone_width;
    trade.greeks_at_entry = position.entry_greeks;
    trade.greeks_at_exit = position.greeks;
    return trade;
}

}  // namespace

BacktestEngine::BacktestEngine(BacktestConfig config, std::shared_ptr<BacktestingAdapter> adapter,
                               std::shared_ptr<QuoteProvider> quotes,
                               std::shared_ptr<SignalGenerator> signals)
    : config_(std::move(config)),
      adapter_(std::move(adapter)),
      quotes_(std::move(quotes)),
      signals_(std::move(signals)) {}

Result<void> BacktestEngine::validate_config() const {
    if (!adapter_ || !quotes_ || !signals_) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "Adapter, quote provider and signal generator are required",
                                "BacktestEngine");
    }
    if (!finite_positive(config_.initial_capital)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "initial_capital must be positive", "BacktestEngine");
    }
    if (config_.warmup_bars < 0 || config_.min_bars_between_entries < 0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "warmup_bars and min_bars_between_entries must not be negative",
                                "BacktestEngine");
    }
    if (config_.max_concurrent_positions < 1) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "max_concurrent_positions must be at least 1", "BacktestEngine");
    }
    if (!std::isfinite(config_.commission_per_contract) || config_.commission_per_contract < 0.0) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "commission_per_contract must not be negative", "BacktestEngine");
    }
    if (!finite_positive(config_.periods_per_year)) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR,
                                "periods_per_year must be positive", "BacktestEngine");
    }

    auto adapter_result = adapter_->validate();
    if (adapter_result.is_error()) {
        return make_error<void>(ErrorCode::CONFIGURATION_ERROR, adapter_result.error()->what(),
                                "BacktestEngine");
    }
    return Result<void>();
}

Result<void> BacktestEngine::validate_bar(const Bar& bar, const Bar* previous) const {
    if (!finite_positive(bar.open) || !finite_positive(bar.high) || !finite_positive(bar.low) ||
        !finite_positive(bar.close)) {
        return make_error<void>(ErrorCode::UNRECOVERABLE_DATA,
                                "Bar at " + core::format_timestamp(bar.timestamp) +
                                    " has a non-finite or non-positive price",
                                "BacktestEngine");
    }
    if (bar.high < bar.low) {
        return make_error<void>(ErrorCode::UNRECOVERABLE_DATA,
                                "Bar at " + core::format_timestamp(bar.timestamp) +
                                    " has high below low",
                                "BacktestEngine");
    }
    if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
        return make_error<void>(ErrorCode::UNRECOVERABLE_DATA,
                                "Bar at " + core::format_timestamp(bar.timestamp) +
                                    " has invalid volume",
                                "BacktestEngine");
    }
    if (previous && bar.timestamp <= previous->timestamp) {
        return make_error<void>(ErrorCode::UNRECOVERABLE_DATA,
                                "Bar timestamps are not strictly increasing at " +
                                    core::format_timestamp(bar.timestamp),
                                "BacktestEngine");
    }
    return Result<void>();
}

Result<BacktestResults> BacktestEngine::run(const std::vector<Bar>& bars) {
    Logger::register_component("BacktestEngine");

    state_ = BacktestState();
    history_.clear();
    fatal_error_.reset();

    auto config_result = validate_config();
    if (config_result.is_error()) {
        ERROR("Backtest not started: " << config_result.error()->what());
        return make_error<BacktestResults>(config_result.error()->code(),
                                           config_result.error()->what(), "BacktestEngine");
    }
    if (bars.empty()) {
        return make_error<BacktestResults>(ErrorCode::INVALID_ARGUMENT, "No bars to backtest",
                                           "BacktestEngine");
    }

    state_.cash = config_.initial_capital;
    state_.equity_peak = config_.initial_capital;
    adapter_->set_valuation_mode(config_.valuation_mode, config_.seed);

    INFO("Starting " << adapter_->name() << " backtest on " << config_.symbol << ": "
                     << bars.size() << " bars from " << core::format_timestamp(bars.front().timestamp)
                     << " to " << core::format_timestamp(bars.back().timestamp) << ", capital "
                     << config_.initial_capital);
    if (config_.valuation_mode == ValuationMode::SEEDED_RANDOM) {
        WARN("Simulation mode: legs without quotes use seeded random valuation (seed "
             << config_.seed << "); results are not a pure historical replay");
    }

    try {
        for (size_t i = 0; i < bars.size(); ++i) {
            const Bar& bar = bars[i];

            auto bar_result = validate_bar(bar, i > 0 ? &bars[i - 1] : nullptr);
            if (bar_result.is_error()) {
                return abort_run(ErrorCode::UNRECOVERABLE_DATA, bar_result.error()->what());
            }

            history_.push_back(bar);
            if (i < static_cast<size_t>(config_.warmup_bars)) {
                continue;
            }

            auto process_result = process_bar(bar, i);
            if (process_result.is_error()) {
                return abort_run(ErrorCode::UNRECOVERABLE_DATA, process_result.error()->what());
            }
        }
    } catch (const std::exception& e) {
        return abort_run(ErrorCode::UNKNOWN_ERROR,
                         std::string("Unexpected error during backtest: ") + e.what());
    }

    close_all(bars.back());

    BacktestResults results = build_results();
    INFO("Backtest complete: " << results.summary.total_trades << " trades, win rate "
                               << results.summary.win_rate * 100.0 << "%, total P&L "
                               << results.summary.total_pnl << ", max drawdown "
                               << results.summary.max_drawdown << ", data gaps "
                               << results.data_gaps);
    return results;
}

Result<BacktestResults> BacktestEngine::abort_run(ErrorCode code, const std::string& message) {
    fatal_error_ = std::make_unique<EngineError>(code, message, "BacktestEngine");
    FATAL("Backtest aborted after " << state_.bars_processed << " bars with "
                                    << state_.ledger.size() << " closed trades and "
                                    << state_.open_positions.size()
                                    << " open positions: " << message);
    return make_error<BacktestResults>(code, message, "BacktestEngine");
}

std::vector<OptionContract> BacktestEngine::contracts_for_bar(const Bar& bar) const {
    std::set<OptionContract> unique;
    for (const auto& contract : adapter_->required_contracts(bar.close, bar.timestamp)) {
        unique.insert(contract);
    }
    for (const auto& position : state_.open_positions) {
        for (const auto& leg : position.legs) {
            unique.insert(leg.contract);
        }
    }
    return std::vector<OptionContract>(unique.begin(), unique.end());
}

Result<void> BacktestEngine::process_bar(const Bar& bar, size_t index) {
    auto quotes_result = quotes_->fetch_quotes(bar, contracts_for_bar(bar));
    if (quotes_result.is_error()) {
        return make_error<void>(ErrorCode::UNRECOVERABLE_DATA,
                                "Quote fetch failed at " + core::format_timestamp(bar.timestamp) +
                                    ": " + quotes_result.error()->what(),
                                "BacktestEngine");
    }
    const std::vector<OptionQuote>& quotes = quotes_result.value();

    mark_and_exit(bar, quotes);
    consider_entry(bar, index, quotes);
    update_equity(bar.timestamp);

    ++state_.bars_processed;
    return Result<void>();
}

void BacktestEngine::mark_and_exit(const Bar& bar, const std::vector<OptionQuote>& quotes) {
    std::vector<Position> still_open;
    still_open.reserve(state_.open_positions.size());

    for (const auto& position : state_.open_positions) {
        Position marked = adapter_->update_position(position, bar, quotes);
        for (const auto& leg : marked.legs) {
            if (leg.estimated) {
                ++state_.estimated_marks;
            }
        }

        double holding = marked.holding_minutes(bar.timestamp);
        auto reason = adapter_->should_exit(marked, bar, quotes, holding);
        if (reason) {
            close_position(marked, bar.timestamp, *reason);
        } else {
            still_open.push_back(std::move(marked));
        }
    }

    state_.open_positions = std::move(still_open);
    refresh_cash();
}

void BacktestEngine::consider_entry(const Bar& bar, size_t index,
                                    const std::vector<OptionQuote>& quotes) {
    if (state_.open_positions.size() >= static_cast<size_t>(config_.max_concurrent_positions)) {
        return;
    }
    if (state_.last_entry_bar &&
        index - *state_.last_entry_bar < static_cast<size_t>(config_.min_bars_between_entries)) {
        return;
    }

    auto signal = signals_->next_signal(history_, quotes);
    if (!signal) {
        return;
    }

    // The signal is acted on at this bar
    signal->timestamp = bar.timestamp;
    state_.signals.push_back(*signal);
    size_t signal_index = state_.signals.size() - 1;

    if (!adapter_->accepts_signal(*signal)) {
        DEBUG("Signal at " << core::format_timestamp(bar.timestamp) << " not accepted");
        return;
    }
    ++state_.signals_accepted;

    auto built = adapter_->build_position(*signal, quotes, bar.close);
    if (built.is_error()) {
        if (built.error()->code() == ErrorCode::DATA_GAP) {
            ++state_.data_gaps;
        }
        WARN("No entry at " << core::format_timestamp(bar.timestamp) << ": "
                            << built.error()->what());
        return;
    }

    Position position = built.take_value();
    double commission = commission_for(position);
    if (position.entry_cost + commission > state_.cash) {
        WARN("Skipping " << position.id << ": entry cost " << position.entry_cost
                         << " plus commission " << commission << " exceeds cash "
                         << state_.cash);
        return;
    }

    position.metadata.signal_index = signal_index;
    position.commission = commission;
    state_.last_entry_bar = index;
    state_.open_positions.push_back(std::move(position));
    refresh_cash();

    const Position& entered = state_.open_positions.back();
    INFO("Entered " << entered.id << " with " << entered.legs.size() << " legs, entry cost "
                    << entered.entry_cost << ", commission " << entered.commission
                    << ", delta " << entered.entry_greeks.delta << ", cash " << state_.cash);
}

void BacktestEngine::close_position(const Position& position, const Timestamp& time,
                                    ExitReason reason) {
    Trade trade = to_trade(position, time, reason, commission_for(position));
    state_.realized_pnl += trade.realized_pnl;
    INFO("Closed " << trade.position_id << " (" << exit_reason_to_string(reason) << ") after "
                   << trade.holding_minutes << " minutes, P&L " << trade.realized_pnl
                   << (trade.estimated ? " [estimated]" : ""));
    state_.ledger.push_back(std::move(trade));
}

void BacktestEngine::close_all(const Bar& bar) {
    for (const auto& position : state_.open_positions) {
        close_position(position, bar.timestamp, ExitReason::END_OF_PERIOD);
    }
    state_.open_positions.clear();
    refresh_cash();
}

void BacktestEngine::refresh_cash() {
    // With nothing open this is exactly initial capital plus ledger P&L
    double committed = 0.0;
    for (const auto& position : state_.open_positions) {
        committed += position.entry_cost + position.commission;
    }
    state_.cash = config_.initial_capital + state_.realized_pnl - committed;
}

double BacktestEngine::commission_for(const Position& position) const {
    return config_.commission_per_contract * contract_count(position);
}

void BacktestEngine::update_equity(const Timestamp& time) {
    double equity = state_.cash;
    for (const auto& position : state_.open_positions) {
        equity += position.current_value;
    }

    state_.equity_peak = std::max(state_.equity_peak, equity);
    state_.max_drawdown = std::max(state_.max_drawdown, state_.equity_peak - equity);
    state_.equity_curve.emplace_back(time, equity);
}

BacktestResults BacktestEngine::build_results() const {
    BacktestResults results;
    results.strategy = adapter_->name();
    results.initial_capital = config_.initial_capital;
    results.final_cash = state_.cash;
    results.trades = state_.ledger;
    results.equity_curve = state_.equity_curve;
    results.bars_processed = state_.bars_processed;
    results.data_gaps = state_.data_gaps;
    results.estimated_marks = state_.estimated_marks;
    results.signals_received = state_.signals.size();
    results.signals_accepted = state_.signals_accepted;
    results.simulated = config_.valuation_mode == ValuationMode::SEEDED_RANDOM;

    results.summary = calculator_.calculate_all_metrics(
        state_.ledger, state_.equity_curve, config_.initial_capital, state_.max_drawdown,
        state_.signals_accepted, config_.periods_per_year);
    results.strategy_metrics = adapter_->strategy_metrics(state_.ledger, state_.signals);
    return results;
}

}  // namespace backtest
}  // namespace options_ngin
