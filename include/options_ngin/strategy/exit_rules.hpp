// include/options_ngin/strategy/exit_rules.hpp
#pragma once

#include <optional>
#include <nlohmann/json.hpp>
#include "options_ngin/core/error.hpp"
#include "options_ngin/strategy/types.hpp"

namespace options_ngin {

/**
 * @brief Dollar and time thresholds that close a position
 *
 * Fixed for the life of a position.
 */
struct ExitThresholds {
    double profit_target{0.0};                   // Close when P&L >= this
    double max_loss{0.0};                        // Close when P&L <= -this
    std::optional<double> target_hold_minutes;   // Planned holding period
    double max_hold_minutes{0.0};                // Hard holding limit

    /**
     * @brief Check the thresholds are usable
     * @return CONFIGURATION_ERROR naming the offending field
     */
    Result<void> validate() const;

    nlohmann::json to_json() const;
    void from_json(const nlohmann::json& j);
};

/**
 * @brief Decide whether an open position closes now
 *
 * Triggers are tested in priority order and the first match wins:
 * profit target, stop loss, target hold, max hold.
 *
 * @param thresholds Thresholds in force for the position
 * @param unrealized_pnl Current unrealized P&L in dollars
 * @param holding_minutes Minutes since entry
 * @return The exit reason, or std::nullopt to stay open
 */
std::optional<ExitReason> evaluate_exit(const ExitThresholds& thresholds, double unrealized_pnl,
                                        double holding_minutes);

}  // namespace options_ngin
