// src/portfolio/option_position.cpp
#include "options_ngin/portfolio/option_position.hpp"
#include <algorithm>
#include <cmath>
#include "options_ngin/core/logger.hpp"

namespace options_ngin {

Result<Position> open_position(std::string id, std::string underlying_symbol,
                               std::vector<PositionLeg> legs, Timestamp entry_time,
                               double multiplier, PositionMetadata metadata) {
    if (legs.empty()) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                    "Position " + id + " has no legs", "OptionPosition");
    }
    if (!(multiplier > 0.0)) {
        return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                    "Contract multiplier must be positive", "OptionPosition");
    }

    Position position;
    position.id = std::move(id);
    position.underlying_symbol = std::move(underlying_symbol);
    position.entry_time = entry_time;
    position.last_update = entry_time;
    position.multiplier = multiplier;
    position.metadata = std::move(metadata);

    double entry_cost = 0.0;
    for (auto& leg : legs) {
        if (leg.quantity <= 0) {
            return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                        "Leg " + leg.contract.to_string() +
                                            " has non-positive quantity",
                                        "OptionPosition");
        }
        if (!std::isfinite(leg.entry_price) || leg.entry_price < 0.0) {
            return make_error<Position>(ErrorCode::INVALID_ARGUMENT,
                                        "Leg " + leg.contract.to_string() +
                                            " has invalid entry price",
                                        "OptionPosition");
        }
        leg.current_price = leg.entry_price;
        entry_cost += leg_value(leg, leg.entry_price, multiplier);
        if (leg.estimated) {
            position.estimated = true;
        }
    }

    position.legs = std::move(legs);
    position.entry_cost = entry_cost;
    position.current_value = entry_cost;
    position.unrealized_pnl = 0.0;
    return position;
}

void refresh_valuation(Position& position) {
    double value = 0.0;
    for (const auto& leg : position.legs) {
        value += leg_value(leg, leg.current_price, position.multiplier);
        if (leg.estimated) {
            position.estimated = true;
        }
    }
    position.current_value = value;
    position.unrealized_pnl = value - position.entry_cost;
    position.peak_pnl = std::max(position.peak_pnl, position.unrealized_pnl);
    position.trough_pnl = std::min(position.trough_pnl, position.unrealized_pnl);
}

PositionValuer::PositionValuer(ValuationParams params) : params_(params) {}

double PositionValuer::estimate_leg_price(const OptionContract& contract,
                                          double underlying_price, const Timestamp& now) const {
    double t = years_between(now, contract.expiration);
    return pricer_
        .estimate(underlying_price, contract.strike, t, params_.estimation_volatility,
                  contract.type)
        .price;
}

Greeks PositionValuer::position_greeks(const Position& position, double underlying_price,
                                       const Timestamp& now,
                                       const std::vector<OptionQuote>& quotes) const {
    Greeks total;
    for (const auto& leg : position.legs) {
        PricingInputs inputs;
        inputs.underlying = underlying_price;
        inputs.strike = leg.contract.strike;
        inputs.time_to_expiry = years_between(now, leg.contract.expiration);
        inputs.volatility = params_.estimation_volatility;
        inputs.rate = params_.risk_free_rate;
        inputs.type = leg.contract.type;

        const OptionQuote* quote =
            find_quote(quotes, leg.contract, params_.expiration_tolerance_days);
        if (quote && std::isfinite(quote->implied_volatility) && quote->implied_volatility > 0.0) {
            inputs.volatility = quote->implied_volatility;
        }

        Greeks g = pricer_.greeks(inputs);
        double scale = side_sign(leg.side) * leg.quantity * position.multiplier;
        total.delta += scale * g.delta;
        total.gamma += scale * g.gamma;
        total.theta += scale * g.theta;
        total.vega += scale * g.vega;
        total.rho += scale * g.rho;
    }
    return total;
}

size_t PositionValuer::mark_to_market(Position& position, const std::vector<OptionQuote>& quotes,
                                      double underlying_price, const Timestamp& now,
                                      const std::function<double(double)>& adjust_estimate) const {
    size_t estimated_legs = 0;

    for (auto& leg : position.legs) {
        const OptionQuote* quote =
            find_quote(quotes, leg.contract, params_.expiration_tolerance_days);

        double price = quote ? quote->mark_price() : 0.0;
        if (quote && std::isfinite(price) && price > 0.0) {
            leg.current_price = price;
            leg.estimated = false;
            DEBUG("Marked " << position.id << " " << leg.contract.to_string() << " at "
                            << price);
            continue;
        }

        leg.current_price = estimate_leg_price(leg.contract, underlying_price, now);
        if (adjust_estimate) {
            leg.current_price =
                std::max(OptionPricer::MIN_PRICE, adjust_estimate(leg.current_price));
        }
        leg.estimated = true;
        ++estimated_legs;
        WARN("No usable quote for " << position.id << " leg " << leg.contract.to_string()
                                    << ", estimated at " << leg.current_price);
    }

    position.last_update = now;
    refresh_valuation(position);
    return estimated_legs;
}

}  // namespace options_ngin
