// src/data/fallback_quote_provider.cpp
#include "options_ngin/data/fallback_quote_provider.hpp"
#include <algorithm>
#include "options_ngin/core/logger.hpp"

namespace options_ngin {

FallbackQuoteProvider::FallbackQuoteProvider(std::vector<ProviderEntry> providers)
    : providers_(std::move(providers)), requests_(providers_.size(), 0) {
    Logger::register_component("FallbackQuoteProvider");
}

Result<std::vector<OptionQuote>> FallbackQuoteProvider::fetch_quotes(
    const Bar& bar, const std::vector<OptionContract>& required) {
    bool attempted = false;
    std::string last_error = "no providers configured";

    for (size_t i = 0; i < providers_.size(); ++i) {
        auto& entry = providers_[i];
        if (!entry.provider) {
            continue;
        }
        if (entry.max_requests > 0 && requests_[i] >= entry.max_requests) {
            DEBUG("Skipping " << entry.name << ", rate limit of " << entry.max_requests
                              << " reached");
            continue;
        }

        attempted = true;
        ++requests_[i];
        auto result = entry.provider->fetch_quotes(bar, required);
        if (result.is_ok()) {
            return result;
        }

        last_error = entry.name + ": " + result.error()->what();
        WARN("Quote provider " << entry.name << " failed: " << result.error()->what());
    }

    if (!attempted) {
        return make_error<std::vector<OptionQuote>>(
            ErrorCode::RATE_LIMITED, "All quote providers are rate limited",
            "FallbackQuoteProvider");
    }
    return make_error<std::vector<OptionQuote>>(
        ErrorCode::MARKET_DATA_ERROR, "All quote providers failed, last: " + last_error,
        "FallbackQuoteProvider");
}

int FallbackQuoteProvider::requests_made(size_t index) const {
    return index < requests_.size() ? requests_[index] : 0;
}

void FallbackQuoteProvider::reset_rate_limits() {
    std::fill(requests_.begin(), requests_.end(), 0);
}

}  // namespace options_ngin
