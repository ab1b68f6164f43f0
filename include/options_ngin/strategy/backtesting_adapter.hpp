// include/options_ngin/strategy/backtesting_adapter.hpp
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"
#include "options_ngin/instruments/option.hpp"
#include "options_ngin/portfolio/option_position.hpp"
#include "options_ngin/strategy/types.hpp"

namespace options_ngin {

/**
 * @brief Named strategy metrics, e.g. "signal_efficiency" or "win_rate_LOW"
 */
using StrategyMetrics = std::map<std::string, double>;

/**
 * @brief How legs without a quote are valued
 */
enum class ValuationMode {
    DETERMINISTIC,  // Pricing approximation only
    SEEDED_RANDOM   // Approximation perturbed by a seeded generator
};

std::string valuation_mode_to_string(ValuationMode mode);

/**
 * @brief Strategy knowledge the backtest loop needs, independent of strategy
 *
 * One implementation per strategy family. The loop holds exactly one adapter
 * per run and never inspects its concrete type.
 */
class BacktestingAdapter {
public:
    virtual ~BacktestingAdapter() = default;

    virtual const std::string& name() const = 0;

    /**
     * @brief Validate thresholds and parameters before a run
     * @return CONFIGURATION_ERROR if the adapter cannot run
     */
    virtual Result<void> validate() const = 0;

    /**
     * @brief Select how missing-quote legs are valued for the next run
     */
    virtual void set_valuation_mode(ValuationMode mode, uint64_t seed) = 0;

    /**
     * @brief Contracts the strategy needs quoted at this bar
     * @param underlying_price Current underlying price
     * @param time Bar timestamp
     */
    virtual std::vector<OptionContract> required_contracts(double underlying_price,
                                                           const Timestamp& time) const = 0;

    /**
     * @brief Whether a signal is actionable by this strategy
     */
    virtual bool accepts_signal(const Signal& signal) const = 0;

    /**
     * @brief Convert an accepted signal into a position
     *
     * The entry time is signal.timestamp.
     *
     * @return The position, or DATA_GAP if any required leg has no usable
     *         quote; a position is never opened on partial legs
     */
    virtual Result<Position> build_position(const Signal& signal,
                                            const std::vector<OptionQuote>& quotes,
                                            double underlying_price) = 0;

    /**
     * @brief Mark a position at this bar
     * @return Copy of position with refreshed leg prices and totals
     */
    virtual Position update_position(const Position& position, const Bar& bar,
                                     const std::vector<OptionQuote>& quotes) = 0;

    /**
     * @brief Exit decision for a freshly marked position
     * @return Reason to close, or std::nullopt to keep it open
     */
    virtual std::optional<ExitReason> should_exit(const Position& position, const Bar& bar,
                                                  const std::vector<OptionQuote>& quotes,
                                                  double holding_minutes) const = 0;

    /**
     * @brief Strategy-specific metrics over a completed run
     *
     * Always contains regime-segmented win rates and "signal_efficiency".
     */
    virtual StrategyMetrics strategy_metrics(const std::vector<Trade>& trades,
                                             const std::vector<Signal>& signals) const = 0;
};

}  // namespace options_ngin
