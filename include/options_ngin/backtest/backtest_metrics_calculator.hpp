// include/options_ngin/backtest/backtest_metrics_calculator.hpp
#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>
#include "options_ngin/core/types.hpp"
#include "options_ngin/strategy/types.hpp"

namespace options_ngin {
namespace backtest {

/**
 * @brief Per-regime slice of the ledger
 */
struct RegimeStats {
    int trades{0};
    int wins{0};
    int losses{0};
    double win_rate{0.0};
    double total_pnl{0.0};
    double avg_pnl{0.0};
};

/**
 * @brief Summary metrics of a completed run
 */
struct PerformanceSummary {
    // Trade statistics
    int total_trades{0};
    int winning_trades{0};
    int losing_trades{0};
    int estimated_trades{0};
    double win_rate{0.0};
    double total_pnl{0.0};
    double total_commission{0.0};  // Already deducted from total_pnl
    double avg_pnl{0.0};
    double avg_win{0.0};
    double avg_loss{0.0};
    double largest_win{0.0};
    double largest_loss{0.0};
    double profit_factor{0.0};
    int max_consecutive_wins{0};
    int max_consecutive_losses{0};
    double avg_holding_minutes{0.0};
    double signal_efficiency{0.0};

    std::map<std::string, int> exit_reasons;
    std::map<std::string, RegimeStats> regimes;
    std::map<std::string, double> monthly_pnl;  // "YYYY-MM" of exit

    // Equity statistics
    double total_return{0.0};
    double max_drawdown{0.0};      // Dollars, peak to trough
    double max_drawdown_pct{0.0};  // Fraction of the peak
    double volatility{0.0};        // Annualized per-bar return volatility
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double calmar_ratio{0.0};
};

/**
 * @brief Stateless calculator for run metrics
 *
 * All methods are const and side-effect free; callers log.
 */
class BacktestMetricsCalculator {
public:
    BacktestMetricsCalculator() = default;

    // ========== Returns ==========

    double calculate_total_return(double start_value, double end_value) const;

    std::vector<double> calculate_returns_from_equity(
        const std::vector<std::pair<Timestamp, double>>& equity_curve) const;

    // ========== Risk-Adjusted ==========

    /**
     * @brief Annualized return volatility
     * @param returns Per-bar returns
     * @param periods_per_year Bars per year used to annualize
     */
    double calculate_volatility(const std::vector<double>& returns, double periods_per_year) const;

    double calculate_sharpe_ratio(const std::vector<double>& returns,
                                  double periods_per_year) const;

    double calculate_sortino_ratio(const std::vector<double>& returns,
                                   double periods_per_year) const;

    /**
     * @brief Total return over maximum fractional drawdown
     * @return 999 when there is no drawdown and the return is not negative
     */
    double calculate_calmar_ratio(double total_return, double max_drawdown) const;

    // ========== Drawdown ==========

    /**
     * @brief Largest peak-to-trough decline as a fraction of the peak
     */
    double calculate_max_drawdown(
        const std::vector<std::pair<Timestamp, double>>& equity_curve) const;

    // ========== Ledger ==========

    /**
     * @brief Fill the trade-statistics part of a summary from the ledger
     */
    void calculate_trade_statistics(const std::vector<Trade>& trades,
                                    PerformanceSummary& summary) const;

    std::map<std::string, RegimeStats> calculate_regime_table(
        const std::vector<Trade>& trades) const;

    std::map<std::string, double> calculate_monthly_pnl(const std::vector<Trade>& trades) const;

    /**
     * @brief Share of qualifying signals that produced a profitable trade
     */
    double calculate_signal_efficiency(const std::vector<Trade>& trades,
                                       size_t qualifying_signals) const;

    // ========== Composite ==========

    /**
     * @brief Compute every summary metric
     * @param trades Completed ledger
     * @param equity_curve Equity after each processed bar
     * @param initial_capital Starting cash
     * @param max_drawdown_dollars Drawdown tracked by the engine
     * @param qualifying_signals Signals the adapter accepted
     * @param periods_per_year Bars per year used to annualize
     */
    PerformanceSummary calculate_all_metrics(
        const std::vector<Trade>& trades,
        const std::vector<std::pair<Timestamp, double>>& equity_curve, double initial_capital,
        double max_drawdown_dollars, size_t qualifying_signals, double periods_per_year) const;

private:
    double calculate_mean(const std::vector<double>& values) const;
    double calculate_std_dev(const std::vector<double>& values, double mean) const;
};

}  // namespace backtest
}  // namespace options_ngin
