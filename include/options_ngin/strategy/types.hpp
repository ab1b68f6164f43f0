// include/options_ngin/strategy/types.hpp
#pragma once

#include <optional>
#include <string>
#include "options_ngin/core/types.hpp"
#include "options_ngin/instruments/option.hpp"

namespace options_ngin {

/**
 * @brief What an upstream signal asks for
 */
enum class SignalAction { HOLD, ENTER };

/**
 * @brief Market context reported alongside a signal
 */
struct SignalIndicators {
    std::optional<double> volatility_index;   // VIX-style level at signal time
    std::optional<std::string> regime;        // Explicit regime label, overrides the level
    std::optional<double> profit_zone_width;  // Width of the breakeven range, in points
    std::string reason;
};

/**
 * @brief Entry signal from the signal-generation collaborator
 */
struct Signal {
    SignalAction action{SignalAction::HOLD};
    std::optional<OptionType> direction;  // Single-leg strategies only
    double confidence{0.0};               // 0-100
    int target_contracts{1};
    std::optional<double> target_strike;
    std::optional<double> stop_loss;    // Dollar loss that closes the position
    std::optional<double> take_profit;  // Dollar gain that closes the position
    Timestamp timestamp;
    SignalIndicators indicators;
};

/**
 * @brief Why a position was closed
 */
enum class ExitReason {
    PROFIT_TARGET,
    STOP_LOSS,
    TARGET_HOLD_REACHED,
    MAX_HOLD_REACHED,
    END_OF_PERIOD  // Forced close at the final bar
};

std::string exit_reason_to_string(ExitReason reason);

/**
 * @brief Closed position as recorded in the ledger
 */
struct Trade {
    std::string position_id;
    std::string strategy;
    Timestamp entry_time;
    Timestamp exit_time;
    double entry_cost{0.0};
    double exit_value{0.0};
    double realized_pnl{0.0};
    double holding_minutes{0.0};
    ExitReason exit_reason{ExitReason::END_OF_PERIOD};
    std::string regime{"UNKNOWN"};
    size_t leg_count{0};
    bool estimated{false};
    size_t signal_index{0};
    double peak_pnl{0.0};
    double trough_pnl{0.0};
    std::optional<OptionType> direction;
    std::optional<double> profit_zone_width;
    double commission{0.0};  // Entry plus exit commission, already in realized_pnl
    Greeks greeks_at_entry;
    Greeks greeks_at_exit;

    bool is_win() const {
        return realized_pnl > 0.0;
    }
};

}  // namespace options_ngin
