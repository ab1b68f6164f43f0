// include/options_ngin/data/synthetic_quote_provider.hpp
#pragma once

#include "options_ngin/data/quote_provider.hpp"
#include "options_ngin/pricing/option_pricer.hpp"

namespace options_ngin {

struct SyntheticQuoteConfig {
    double volatility{0.20};
    double risk_free_rate{0.05};
    double half_spread_percent{1.0};  // Of the theoretical value
    double min_half_spread{0.05};
};

/**
 * @brief Prices every requested contract off the bar's close
 *
 * last is the theoretical value and bid/ask straddle it, so marks equal the
 * model price. Output depends only on the inputs.
 */
class SyntheticQuoteProvider : public QuoteProvider {
public:
    explicit SyntheticQuoteProvider(SyntheticQuoteConfig config = SyntheticQuoteConfig());

    Result<std::vector<OptionQuote>> fetch_quotes(
        const Bar& bar, const std::vector<OptionContract>& required) override;

    /**
     * @brief Quote one contract at an underlying price and time
     */
    OptionQuote quote(const OptionContract& contract, double underlying_price,
                      const Timestamp& time) const;

private:
    SyntheticQuoteConfig config_;
    OptionPricer pricer_;
};

}  // namespace options_ngin
