// src/pricing/option_pricer.cpp
#include "options_ngin/pricing/option_pricer.hpp"
#include <algorithm>
#include <cmath>
#include "options_ngin/core/logger.hpp"

namespace options_ngin {

namespace {
constexpr double SQRT_2PI = 2.506628274631000502415765284811045253006;
constexpr int MAX_ITERATIONS = 100;
constexpr double IV_TOLERANCE = 1e-7;
constexpr double IV_LOWER = 1e-4;
constexpr double IV_UPPER = 5.0;
constexpr double TIME_VALUE_FACTOR = 0.4;

double norm_cdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double norm_pdf(double x) {
    return std::exp(-0.5 * x * x) / SQRT_2PI;
}

bool finite_positive(double x) {
    return std::isfinite(x) && x > 0.0;
}

}  // anonymous namespace

OptionPricer::OptionPricer() {
    Logger::register_component("OptionPricer");
}

double OptionPricer::intrinsic_value(double underlying, double strike, OptionType type) {
    if (type == OptionType::CALL) {
        return std::max(0.0, underlying - strike);
    }
    return std::max(0.0, strike - underlying);
}

PricingInputs OptionPricer::sanitize(const PricingInputs& inputs) {
    PricingInputs in = inputs;
    if (!std::isfinite(in.volatility) || in.volatility < MIN_VOLATILITY) {
        in.volatility = MIN_VOLATILITY;
    }
    // Exactly zero means expired; anything else non-positive is clamped
    if (!std::isfinite(in.time_to_expiry) || in.time_to_expiry < 0.0) {
        in.time_to_expiry = MIN_TIME;
    }
    if (!std::isfinite(in.rate)) {
        in.rate = 0.0;
    }
    if (!std::isfinite(in.dividend_yield)) {
        in.dividend_yield = 0.0;
    }
    return in;
}

double OptionPricer::analytic_value(const PricingInputs& in) {
    if (in.time_to_expiry == 0.0) {
        return intrinsic_value(in.underlying, in.strike, in.type);
    }

    double sqrt_t = std::sqrt(in.time_to_expiry);
    double d1 = (std::log(in.underlying / in.strike) +
                 (in.rate - in.dividend_yield + 0.5 * in.volatility * in.volatility) *
                     in.time_to_expiry) /
                (in.volatility * sqrt_t);
    double d2 = d1 - in.volatility * sqrt_t;
    double disc_s = in.underlying * std::exp(-in.dividend_yield * in.time_to_expiry);
    double disc_k = in.strike * std::exp(-in.rate * in.time_to_expiry);

    if (in.type == OptionType::CALL) {
        return disc_s * norm_cdf(d1) - disc_k * norm_cdf(d2);
    }
    return disc_k * norm_cdf(-d2) - disc_s * norm_cdf(-d1);
}

double OptionPricer::price(double underlying, double strike, double time_to_expiry,
                           double volatility, double rate, OptionType type) const {
    PricingInputs in;
    in.underlying = underlying;
    in.strike = strike;
    in.time_to_expiry = time_to_expiry;
    in.volatility = volatility;
    in.rate = rate;
    in.type = type;
    return evaluate(in).price;
}

PricingResult OptionPricer::evaluate(const PricingInputs& inputs) const {
    PricingInputs in = sanitize(inputs);

    if (!finite_positive(in.underlying) || !finite_positive(in.strike)) {
        WARN("Cannot price " << option_type_to_string(in.type) << " with underlying "
                             << in.underlying << " and strike " << in.strike
                             << ", using minimum price");
        PricingResult result;
        result.price = MIN_PRICE;
        result.time_value = MIN_PRICE;
        result.degraded = true;
        return result;
    }

    double value = analytic_value(in);
    if (!std::isfinite(value)) {
        WARN("Analytic pricing failed for " << option_type_to_string(in.type) << " K=" << in.strike
                                            << " S=" << in.underlying << " T="
                                            << in.time_to_expiry << ", using approximation");
        return estimate(in.underlying, in.strike, in.time_to_expiry, in.volatility, in.type);
    }

    PricingResult result;
    result.intrinsic = intrinsic_value(in.underlying, in.strike, in.type);
    result.price = std::max(MIN_PRICE, value);
    result.time_value = std::max(0.0, result.price - result.intrinsic);
    result.greeks = greeks(in);
    return result;
}

Greeks OptionPricer::greeks(const PricingInputs& inputs) const {
    PricingInputs in = sanitize(inputs);
    Greeks g;

    if (!finite_positive(in.underlying) || !finite_positive(in.strike)) {
        return g;
    }

    if (in.time_to_expiry == 0.0) {
        // Expired: only delta survives, as the exercise indicator
        if (in.type == OptionType::CALL) {
            g.delta = in.underlying > in.strike ? 1.0 : 0.0;
        } else {
            g.delta = in.underlying < in.strike ? -1.0 : 0.0;
        }
        return g;
    }

    double t = in.time_to_expiry;
    double sqrt_t = std::sqrt(t);
    double d1 = (std::log(in.underlying / in.strike) +
                 (in.rate - in.dividend_yield + 0.5 * in.volatility * in.volatility) * t) /
                (in.volatility * sqrt_t);
    double d2 = d1 - in.volatility * sqrt_t;
    double div_disc = std::exp(-in.dividend_yield * t);
    double rate_disc = std::exp(-in.rate * t);
    double pdf_d1 = norm_pdf(d1);

    double decay = -in.underlying * div_disc * pdf_d1 * in.volatility / (2.0 * sqrt_t);

    if (in.type == OptionType::CALL) {
        g.delta = div_disc * norm_cdf(d1);
        g.theta = decay - in.rate * in.strike * rate_disc * norm_cdf(d2) +
                  in.dividend_yield * in.underlying * div_disc * norm_cdf(d1);
        g.rho = in.strike * t * rate_disc * norm_cdf(d2);
    } else {
        g.delta = div_disc * (norm_cdf(d1) - 1.0);
        g.theta = decay + in.rate * in.strike * rate_disc * norm_cdf(-d2) -
                  in.dividend_yield * in.underlying * div_disc * norm_cdf(-d1);
        g.rho = -in.strike * t * rate_disc * norm_cdf(-d2);
    }

    g.gamma = div_disc * pdf_d1 / (in.underlying * in.volatility * sqrt_t);
    g.vega = in.underlying * div_disc * pdf_d1 * sqrt_t;

    g.theta /= DAYS_PER_YEAR;
    g.vega /= 100.0;
    g.rho /= 100.0;

    if (!std::isfinite(g.delta) || !std::isfinite(g.gamma) || !std::isfinite(g.vega)) {
        return Greeks{};
    }

    g.delta = std::clamp(g.delta, -1.0, 1.0);
    g.gamma = std::max(0.0, g.gamma);
    g.vega = std::max(0.0, g.vega);
    return g;
}

PricingResult OptionPricer::estimate(double underlying, double strike, double time_to_expiry,
                                     double volatility, OptionType type) const {
    PricingResult result;
    result.degraded = true;

    if (!finite_positive(underlying) || !finite_positive(strike)) {
        result.price = MIN_PRICE;
        result.time_value = MIN_PRICE;
        return result;
    }

    double t = std::isfinite(time_to_expiry) ? std::max(0.0, time_to_expiry) : 0.0;
    double vol = std::isfinite(volatility) ? std::max(MIN_VOLATILITY, volatility) : MIN_VOLATILITY;

    double ratio = underlying / strike;
    double moneyness =
        type == OptionType::CALL ? std::clamp(ratio, 0.1, 1.0) : std::clamp(2.0 - ratio, 0.1, 1.0);

    result.intrinsic = intrinsic_value(underlying, strike, type);
    double time_value = TIME_VALUE_FACTOR * underlying * vol * std::sqrt(t) * moneyness;
    result.price = std::max(MIN_PRICE, result.intrinsic + time_value);
    result.time_value = result.price - result.intrinsic;
    return result;
}

Result<double> OptionPricer::implied_volatility(double market_price, double underlying,
                                                double strike, double time_to_expiry, double rate,
                                                OptionType type) const {
    if (!finite_positive(market_price) || !finite_positive(underlying) ||
        !finite_positive(strike) || !finite_positive(time_to_expiry)) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Implied volatility needs positive price, underlying, strike "
                                  "and time to expiry",
                                  "OptionPricer");
    }

    PricingInputs in;
    in.underlying = underlying;
    in.strike = strike;
    in.time_to_expiry = time_to_expiry;
    in.rate = rate;
    in.type = type;

    auto value_at = [&in](double vol) {
        in.volatility = vol;
        return analytic_value(in);
    };

    double low = IV_LOWER;
    double high = IV_UPPER;
    double f_low = value_at(low) - market_price;
    double f_high = value_at(high) - market_price;

    if (f_low > 0.0 || f_high < 0.0) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT,
                                  "Market price " + std::to_string(market_price) +
                                      " is outside the attainable range for strike " +
                                      std::to_string(strike),
                                  "OptionPricer");
    }

    double vol = 0.3;
    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        double diff = value_at(vol) - market_price;
        if (std::abs(diff) < IV_TOLERANCE) {
            return vol;
        }

        // Value is increasing in volatility, so the sign of diff moves the bracket
        if (diff > 0.0) {
            high = vol;
        } else {
            low = vol;
        }

        in.volatility = vol;
        double vega = greeks(in).vega * 100.0;
        double next = vega > 1e-12 ? vol - diff / vega : low - 1.0;
        if (!(next > low && next < high)) {
            next = 0.5 * (low + high);
        }
        vol = next;

        if (high - low < 1e-10) {
            return vol;
        }
    }

    return make_error<double>(ErrorCode::PRICING_DEGRADED,
                              "Implied volatility did not converge for strike " +
                                  std::to_string(strike),
                              "OptionPricer");
}

}  // namespace options_ngin
