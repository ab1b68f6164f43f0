// src/data/synthetic_quote_provider.cpp
#include "options_ngin/data/synthetic_quote_provider.hpp"
#include <algorithm>
#include <cmath>

namespace options_ngin {

SyntheticQuoteProvider::SyntheticQuoteProvider(SyntheticQuoteConfig config) : config_(config) {}

OptionQuote SyntheticQuoteProvider::quote(const OptionContract& contract, double underlying_price,
                                          const Timestamp& time) const {
    PricingInputs in;
    in.underlying = underlying_price;
    in.strike = contract.strike;
    in.time_to_expiry = years_between(time, contract.expiration);
    in.volatility = config_.volatility;
    in.rate = config_.risk_free_rate;
    in.type = contract.type;

    PricingResult priced = pricer_.evaluate(in);
    double half_spread =
        std::max(config_.min_half_spread, priced.price * config_.half_spread_percent / 100.0);

    OptionQuote q;
    q.type = contract.type;
    q.strike = contract.strike;
    q.expiration = contract.expiration;
    q.last = priced.price;
    q.bid = std::max(0.0, priced.price - half_spread);
    q.ask = priced.price + half_spread;
    q.implied_volatility = config_.volatility;
    return q;
}

Result<std::vector<OptionQuote>> SyntheticQuoteProvider::fetch_quotes(
    const Bar& bar, const std::vector<OptionContract>& required) {
    if (!std::isfinite(bar.close) || bar.close <= 0.0) {
        return make_error<std::vector<OptionQuote>>(
            ErrorCode::MARKET_DATA_ERROR, "Cannot quote off a non-positive close",
            "SyntheticQuoteProvider");
    }

    std::vector<OptionQuote> quotes;
    quotes.reserve(required.size());
    for (const auto& contract : required) {
        quotes.push_back(quote(contract, bar.close, bar.timestamp));
    }
    return quotes;
}

}  // namespace options_ngin
