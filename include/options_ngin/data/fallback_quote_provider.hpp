// include/options_ngin/data/fallback_quote_provider.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "options_ngin/data/quote_provider.hpp"

namespace options_ngin {

/**
 * @brief One entry of the provider priority list
 */
struct ProviderEntry {
    std::string name;
    std::shared_ptr<QuoteProvider> provider;
    int max_requests{0};  // Requests allowed before the provider is skipped; 0 means unlimited
};

/**
 * @brief Tries providers in priority order until one answers
 *
 * The priority list is fixed at construction. Request counters belong to
 * this instance, so separate runs do not share rate-limit state.
 */
class FallbackQuoteProvider : public QuoteProvider {
public:
    explicit FallbackQuoteProvider(std::vector<ProviderEntry> providers);

    /**
     * @return First successful snapshot; RATE_LIMITED if every provider is
     *         exhausted, MARKET_DATA_ERROR if every attempted provider failed
     */
    Result<std::vector<OptionQuote>> fetch_quotes(
        const Bar& bar, const std::vector<OptionContract>& required) override;

    int requests_made(size_t index) const;

    void reset_rate_limits();

private:
    std::vector<ProviderEntry> providers_;
    std::vector<int> requests_;
};

}  // namespace options_ngin
