// include/options_ngin/portfolio/option_position.hpp
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"
#include "options_ngin/instruments/option.hpp"
#include "options_ngin/pricing/option_pricer.hpp"

namespace options_ngin {

/**
 * @brief One option contract held inside a position
 */
struct PositionLeg {
    OptionContract contract;
    LegSide side{LegSide::LONG};
    int quantity{0};            // Contracts, always positive
    double entry_price{0.0};    // Per-share premium paid or received
    double current_price{0.0};  // Per-share premium at the last mark
    bool estimated{false};      // Last mark came from the approximation

    PositionLeg() = default;
    PositionLeg(OptionContract c, LegSide s, int qty, double price)
        : contract(c), side(s), quantity(qty), entry_price(price), current_price(price) {}
};

/**
 * @brief Fixed descriptive fields recorded on a position at entry
 */
struct PositionMetadata {
    std::string strategy;
    std::string regime{"UNKNOWN"};
    std::optional<double> volatility_index;
    double max_loss{0.0};       // Stated dollar loss that triggers a stop
    double profit_target{0.0};  // Stated dollar gain that triggers a take-profit
    std::optional<double> profit_zone_width;
    std::optional<OptionType> direction;
    double entry_underlying{0.0};
    size_t signal_index{0};     // Index of the accepted signal in the run
};

/**
 * @brief A multi-leg option position
 *
 * entry_cost is the signed net premium including the contract multiplier:
 * positive for a net debit, negative for a net credit. current_value uses
 * the same convention, so unrealized_pnl = current_value - entry_cost.
 */
struct Position {
    std::string id;
    std::string underlying_symbol;
    std::vector<PositionLeg> legs;
    Timestamp entry_time;
    Timestamp last_update;
    double multiplier{100.0};
    double entry_cost{0.0};
    double current_value{0.0};
    double unrealized_pnl{0.0};
    double peak_pnl{0.0};    // Best unrealized P&L seen while open
    double trough_pnl{0.0};  // Worst unrealized P&L seen while open
    bool estimated{false};   // Any mark so far used the approximation
    double commission{0.0};  // Commission paid so far, in dollars
    Greeks entry_greeks;     // Dollar-weighted position Greeks at entry
    Greeks greeks;           // Dollar-weighted position Greeks at the last mark
    PositionMetadata metadata;

    double holding_minutes(const Timestamp& now) const {
        return minutes_between(entry_time, now);
    }

    bool is_net_credit() const {
        return entry_cost < 0.0;
    }
};

/**
 * @brief Number of contracts across all legs
 */
inline int contract_count(const Position& position) {
    int total = 0;
    for (const auto& leg : position.legs) {
        total += leg.quantity;
    }
    return total;
}

/**
 * @brief Dollar value of a leg at a per-share price
 */
inline double leg_value(const PositionLeg& leg, double price, double multiplier) {
    return price * leg.quantity * multiplier * side_sign(leg.side);
}

/**
 * @brief Create an open position from filled legs
 *
 * @return INVALID_ARGUMENT if there are no legs, a quantity is not positive,
 *         a price is negative or non-finite, or the multiplier is not positive
 */
Result<Position> open_position(std::string id, std::string underlying_symbol,
                               std::vector<PositionLeg> legs, Timestamp entry_time,
                               double multiplier, PositionMetadata metadata);

/**
 * @brief Recompute current_value, unrealized_pnl and the P&L extremes from
 *        the legs' current prices
 */
void refresh_valuation(Position& position);

/**
 * @brief Parameters for marking positions against a quote snapshot
 */
struct ValuationParams {
    double expiration_tolerance_days{1.0};
    double estimation_volatility{0.20};  // Used when a leg has no quote
    double risk_free_rate{0.05};
};

/**
 * @brief Marks positions to market from quotes, estimating missing legs
 */
class PositionValuer {
public:
    explicit PositionValuer(ValuationParams params);

    /**
     * @brief Mark every leg and refresh the position totals
     *
     * A leg with a matching quote is marked at last if positive, else at the
     * bid/ask midpoint. A leg with no usable quote is valued with the pricing
     * approximation at the current underlying price and remaining time, and
     * flagged estimated. adjust_estimate, when set, maps each estimated
     * price to the value actually used.
     *
     * @return Number of legs that had to be estimated
     */
    size_t mark_to_market(Position& position, const std::vector<OptionQuote>& quotes,
                          double underlying_price, const Timestamp& now,
                          const std::function<double(double)>& adjust_estimate = {}) const;

    /**
     * @brief Approximate per-share value of a contract without a quote
     */
    double estimate_leg_price(const OptionContract& contract, double underlying_price,
                              const Timestamp& now) const;

    /**
     * @brief Aggregate Greeks of a position, scaled by side, quantity and
     *        multiplier
     *
     * Each leg uses the implied volatility of its matching quote when one is
     * supplied and positive, otherwise the estimation volatility.
     */
    Greeks position_greeks(const Position& position, double underlying_price,
                           const Timestamp& now,
                           const std::vector<OptionQuote>& quotes = {}) const;

    const ValuationParams& params() const {
        return params_;
    }

private:
    ValuationParams params_;
    OptionPricer pricer_;
};

}  // namespace options_ngin
