// src/backtest/backtest_metrics_calculator.cpp
#include "options_ngin/backtest/backtest_metrics_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include "options_ngin/core/time_utils.hpp"

namespace options_ngin {
namespace backtest {

// ========== Returns ==========

double BacktestMetricsCalculator::calculate_total_return(double start_value,
                                                         double end_value) const {
    if (start_value <= 0.0) {
        return 0.0;
    }
    return (end_value - start_value) / start_value;
}

std::vector<double> BacktestMetricsCalculator::calculate_returns_from_equity(
    const std::vector<std::pair<Timestamp, double>>& equity_curve) const {
    std::vector<double> returns;
    if (equity_curve.size() < 2) {
        return returns;
    }

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        double prev = equity_curve[i - 1].second;
        if (prev > 0.0) {
            returns.push_back((equity_curve[i].second - prev) / prev);
        }
    }
    return returns;
}

// ========== Risk-Adjusted ==========

double BacktestMetricsCalculator::calculate_volatility(const std::vector<double>& returns,
                                                       double periods_per_year) const {
    if (returns.size() < 2 || periods_per_year <= 0.0) {
        return 0.0;
    }
    return calculate_std_dev(returns, calculate_mean(returns)) * std::sqrt(periods_per_year);
}

double BacktestMetricsCalculator::calculate_sharpe_ratio(const std::vector<double>& returns,
                                                         double periods_per_year) const {
    if (returns.size() < 2 || periods_per_year <= 0.0) {
        return 0.0;
    }
    double mean = calculate_mean(returns);
    double std_dev = calculate_std_dev(returns, mean);
    if (std_dev <= 0.0) {
        return 0.0;
    }
    return mean / std_dev * std::sqrt(periods_per_year);
}

double BacktestMetricsCalculator::calculate_sortino_ratio(const std::vector<double>& returns,
                                                          double periods_per_year) const {
    if (returns.empty() || periods_per_year <= 0.0) {
        return 0.0;
    }

    double mean = calculate_mean(returns);
    double downside_sum = 0.0;
    for (double r : returns) {
        if (r < 0.0) {
            downside_sum += r * r;
        }
    }
    double downside_dev = std::sqrt(downside_sum / returns.size());

    if (downside_dev <= 0.0) {
        // No losing bars
        return mean >= 0.0 ? 999.0 : 0.0;
    }
    return mean / downside_dev * std::sqrt(periods_per_year);
}

double BacktestMetricsCalculator::calculate_calmar_ratio(double total_return,
                                                         double max_drawdown) const {
    if (max_drawdown <= 0.0) {
        return total_return >= 0.0 ? 999.0 : 0.0;
    }
    return total_return / max_drawdown;
}

// ========== Drawdown ==========

double BacktestMetricsCalculator::calculate_max_drawdown(
    const std::vector<std::pair<Timestamp, double>>& equity_curve) const {
    if (equity_curve.empty()) {
        return 0.0;
    }

    double peak = equity_curve.front().second;
    double max_dd = 0.0;
    for (const auto& [timestamp, equity] : equity_curve) {
        peak = std::max(peak, equity);
        if (peak > 0.0 && equity < peak) {
            max_dd = std::max(max_dd, (peak - equity) / peak);
        }
    }
    return max_dd;
}

// ========== Ledger ==========

void BacktestMetricsCalculator::calculate_trade_statistics(const std::vector<Trade>& trades,
                                                           PerformanceSummary& summary) const {
    summary.total_trades = static_cast<int>(trades.size());
    if (trades.empty()) {
        return;
    }

    double gross_profit = 0.0;
    double gross_loss = 0.0;
    double holding = 0.0;
    int win_streak = 0;
    int loss_streak = 0;

    for (const auto& trade : trades) {
        summary.total_pnl += trade.realized_pnl;
        summary.total_commission += trade.commission;
        holding += trade.holding_minutes;
        summary.exit_reasons[exit_reason_to_string(trade.exit_reason)]++;
        if (trade.estimated) {
            ++summary.estimated_trades;
        }

        if (trade.is_win()) {
            ++summary.winning_trades;
            gross_profit += trade.realized_pnl;
            summary.largest_win = std::max(summary.largest_win, trade.realized_pnl);
            ++win_streak;
            loss_streak = 0;
        } else {
            ++summary.losing_trades;
            gross_loss += -trade.realized_pnl;
            summary.largest_loss = std::min(summary.largest_loss, trade.realized_pnl);
            ++loss_streak;
            win_streak = 0;
        }
        summary.max_consecutive_wins = std::max(summary.max_consecutive_wins, win_streak);
        summary.max_consecutive_losses = std::max(summary.max_consecutive_losses, loss_streak);
    }

    double count = static_cast<double>(trades.size());
    summary.win_rate = summary.winning_trades / count;
    summary.avg_pnl = summary.total_pnl / count;
    summary.avg_holding_minutes = holding / count;
    summary.avg_win = summary.winning_trades > 0 ? gross_profit / summary.winning_trades : 0.0;
    summary.avg_loss = summary.losing_trades > 0 ? -gross_loss / summary.losing_trades : 0.0;

    if (gross_loss > 0.0) {
        summary.profit_factor = gross_profit / gross_loss;
    } else {
        summary.profit_factor = gross_profit > 0.0 ? 999.0 : 0.0;
    }
}

std::map<std::string, RegimeStats> BacktestMetricsCalculator::calculate_regime_table(
    const std::vector<Trade>& trades) const {
    std::map<std::string, RegimeStats> table;

    for (const auto& trade : trades) {
        auto& stats = table[trade.regime];
        ++stats.trades;
        stats.total_pnl += trade.realized_pnl;
        if (trade.is_win()) {
            ++stats.wins;
        } else {
            ++stats.losses;
        }
    }

    for (auto& [regime, stats] : table) {
        stats.win_rate = static_cast<double>(stats.wins) / stats.trades;
        stats.avg_pnl = stats.total_pnl / stats.trades;
    }
    return table;
}

std::map<std::string, double> BacktestMetricsCalculator::calculate_monthly_pnl(
    const std::vector<Trade>& trades) const {
    std::map<std::string, double> monthly;
    for (const auto& trade : trades) {
        std::string month = core::format_timestamp(trade.exit_time).substr(0, 7);
        monthly[month] += trade.realized_pnl;
    }
    return monthly;
}

double BacktestMetricsCalculator::calculate_signal_efficiency(const std::vector<Trade>& trades,
                                                              size_t qualifying_signals) const {
    if (qualifying_signals == 0) {
        return 0.0;
    }
    std::set<size_t> profitable;
    for (const auto& trade : trades) {
        if (trade.is_win()) {
            profitable.insert(trade.signal_index);
        }
    }
    return static_cast<double>(profitable.size()) / qualifying_signals;
}

// ========== Composite ==========

PerformanceSummary BacktestMetricsCalculator::calculate_all_metrics(
    const std::vector<Trade>& trades,
    const std::vector<std::pair<Timestamp, double>>& equity_curve, double initial_capital,
    double max_drawdown_dollars, size_t qualifying_signals, double periods_per_year) const {
    PerformanceSummary summary;

    calculate_trade_statistics(trades, summary);
    summary.regimes = calculate_regime_table(trades);
    summary.monthly_pnl = calculate_monthly_pnl(trades);
    summary.signal_efficiency = calculate_signal_efficiency(trades, qualifying_signals);

    double final_equity = equity_curve.empty() ? initial_capital : equity_curve.back().second;
    summary.total_return = calculate_total_return(initial_capital, final_equity);
    summary.max_drawdown = max_drawdown_dollars;
    summary.max_drawdown_pct = calculate_max_drawdown(equity_curve);

    auto returns = calculate_returns_from_equity(equity_curve);
    summary.volatility = calculate_volatility(returns, periods_per_year);
    summary.sharpe_ratio = calculate_sharpe_ratio(returns, periods_per_year);
    summary.sortino_ratio = calculate_sortino_ratio(returns, periods_per_year);
    summary.calmar_ratio = calculate_calmar_ratio(summary.total_return, summary.max_drawdown_pct);

    return summary;
}

// ========== Helpers ==========

double BacktestMetricsCalculator::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

double BacktestMetricsCalculator::calculate_std_dev(const std::vector<double>& values,
                                                    double mean) const {
    if (values.size() < 2) {
        return 0.0;
    }
    double sq_sum = 0.0;
    for (double v : values) {
        sq_sum += (v - mean) * (v - mean);
    }
    return std::sqrt(sq_sum / (values.size() - 1));
}

}  // namespace backtest
}  // namespace options_ngin
