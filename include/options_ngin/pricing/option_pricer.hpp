// include/options_ngin/pricing/option_pricer.hpp
#pragma once

#include "options_ngin/core/error.hpp"
#include "options_ngin/instruments/option.hpp"

namespace options_ngin {

/**
 * @brief Scalar inputs for one option valuation
 */
struct PricingInputs {
    double underlying{0.0};
    double strike{0.0};
    double time_to_expiry{0.0};  // Years
    double volatility{0.0};      // Annualized, decimal
    double rate{0.0};            // Continuously compounded
    double dividend_yield{0.0};  // Continuous
    OptionType type{OptionType::CALL};
};

/**
 * @brief Valuation with its sensitivities
 *
 * degraded is set when the analytic formula could not be used and the
 * value comes from the moneyness-scaled approximation instead.
 */
struct PricingResult {
    double price{0.0};
    double intrinsic{0.0};
    double time_value{0.0};
    Greeks greeks;
    bool degraded{false};
};

/**
 * @brief Closed-form European option pricing (Black-Scholes-Merton)
 *
 * Prices are floored at MIN_PRICE. Degenerate volatility or time inputs are
 * clamped instead of rejected so a backtest never stops on one bad value.
 */
class OptionPricer {
public:
    static constexpr double MIN_PRICE = 0.01;
    static constexpr double MIN_VOLATILITY = 1e-4;
    static constexpr double MIN_TIME = 1e-10;

    OptionPricer();

    /**
     * @brief Option value, never below MIN_PRICE
     * @param underlying Underlying price
     * @param strike Strike price
     * @param time_to_expiry Time to expiry in years; 0 gives intrinsic value
     * @param volatility Annualized volatility
     * @param rate Risk-free rate
     * @param type Call or put
     */
    double price(double underlying, double strike, double time_to_expiry, double volatility,
                 double rate, OptionType type) const;

    /**
     * @brief Full valuation: price, intrinsic/time split and Greeks
     *
     * Falls back to estimate() when the analytic path produces a non-finite
     * value; the result is then flagged degraded and a warning is logged.
     */
    PricingResult evaluate(const PricingInputs& inputs) const;

    /**
     * @brief Analytic sensitivities
     * @return Greeks with theta per day and vega/rho per percentage point
     */
    Greeks greeks(const PricingInputs& inputs) const;

    /**
     * @brief Moneyness-scaled approximation used when no analytic value exists
     *
     * intrinsic + 0.4 * S * sigma * sqrt(T) * m, with m clamped to [0.1, 1].
     * Always flagged degraded.
     */
    PricingResult estimate(double underlying, double strike, double time_to_expiry,
                           double volatility, OptionType type) const;

    /**
     * @brief Volatility implied by a market price
     *
     * Newton-Raphson on vega, falling back to bisection whenever a Newton
     * step leaves the bracket.
     *
     * @return Volatility, or INVALID_ARGUMENT for prices outside no-arbitrage
     *         bounds, or PRICING_DEGRADED when the search does not converge
     */
    Result<double> implied_volatility(double market_price, double underlying, double strike,
                                      double time_to_expiry, double rate, OptionType type) const;

    static double intrinsic_value(double underlying, double strike, OptionType type);

private:
    // Unfloored Black-Scholes-Merton value; inputs must already be sanitized
    static double analytic_value(const PricingInputs& in);
    static PricingInputs sanitize(const PricingInputs& inputs);
};

}  // namespace options_ngin
