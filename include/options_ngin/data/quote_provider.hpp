// include/options_ngin/data/quote_provider.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"
#include "options_ngin/instruments/option.hpp"
#include "options_ngin/pricing/option_pricer.hpp"

namespace options_ngin {

/**
 * @brief Source of option quotes for the backtest loop
 *
 * fetch_quotes is a blocking request-response call. Retry and timeout policy
 * belong to the implementation; an error result aborts the run.
 */
class QuoteProvider {
public:
    virtual ~QuoteProvider() = default;

    /**
     * @brief Quotes available at a bar
     * @param bar Bar being processed
     * @param required Contracts the strategy and the open positions need
     * @return Quote snapshot (possibly missing some contracts) or an error
     */
    virtual Result<std::vector<OptionQuote>> fetch_quotes(
        const Bar& bar, const std::vector<OptionContract>& required) = 0;
};

/**
 * @brief Replays recorded quote snapshots
 *
 * Returns the latest snapshot stamped at or before the bar, or an empty
 * snapshot when none precedes it. Quotes recorded without an implied
 * volatility get one solved from their mark against the bar close.
 */
class InMemoryQuoteProvider : public QuoteProvider {
public:
    explicit InMemoryQuoteProvider(double risk_free_rate = 0.05);

    void add_snapshot(const Timestamp& time, std::vector<OptionQuote> quotes);

    /**
     * @brief Group quotes by their own timestamps into snapshots
     */
    void add_quotes(const std::vector<std::pair<Timestamp, OptionQuote>>& stamped_quotes);

    Result<std::vector<OptionQuote>> fetch_quotes(
        const Bar& bar, const std::vector<OptionContract>& required) override;

    size_t snapshot_count() const {
        return snapshots_.size();
    }

private:
    void fill_implied_volatility(OptionQuote& quote, const Bar& bar) const;

    std::map<Timestamp, std::vector<OptionQuote>> snapshots_;
    double risk_free_rate_;
    OptionPricer pricer_;
};

}  // namespace options_ngin
