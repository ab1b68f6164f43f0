// src/data/quote_provider.cpp
#include "options_ngin/data/quote_provider.hpp"
#include <cmath>
#include "options_ngin/core/logger.hpp"

namespace options_ngin {

InMemoryQuoteProvider::InMemoryQuoteProvider(double risk_free_rate)
    : risk_free_rate_(risk_free_rate) {
    Logger::register_component("QuoteProvider");
}

void InMemoryQuoteProvider::add_snapshot(const Timestamp& time, std::vector<OptionQuote> quotes) {
    snapshots_[time] = std::move(quotes);
}

void InMemoryQuoteProvider::add_quotes(
    const std::vector<std::pair<Timestamp, OptionQuote>>& stamped_quotes) {
    for (const auto& [time, quote] : stamped_quotes) {
        snapshots_[time].push_back(quote);
    }
}

Result<std::vector<OptionQuote>> InMemoryQuoteProvider::fetch_quotes(
    const Bar& bar, const std::vector<OptionContract>& /*required*/) {
    auto it = snapshots_.upper_bound(bar.timestamp);
    if (it == snapshots_.begin()) {
        return std::vector<OptionQuote>{};
    }
    --it;

    std::vector<OptionQuote> quotes = it->second;
    for (auto& quote : quotes) {
        if (!(quote.implied_volatility > 0.0)) {
            fill_implied_volatility(quote, bar);
        }
    }
    return quotes;
}

void InMemoryQuoteProvider::fill_implied_volatility(OptionQuote& quote, const Bar& bar) const {
    double mark = quote.mark_price();
    double t = years_between(bar.timestamp, quote.expiration);
    if (!std::isfinite(mark) || mark <= 0.0 || t <= 0.0) {
        return;
    }

    auto solved = pricer_.implied_volatility(mark, bar.close, quote.strike, t, risk_free_rate_,
                                             quote.type);
    if (solved.is_error()) {
        DEBUG("No implied volatility for " << quote.contract().to_string() << " at mark "
                                           << mark << ": " << solved.error()->what());
        return;
    }
    quote.implied_volatility = solved.value();
}

}  // namespace options_ngin
