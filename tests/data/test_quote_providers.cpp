#include <gtest/gtest.h>
#include <memory>
#include "../core/test_base.hpp"
#include "options_ngin/data/fallback_quote_provider.hpp"
#include "options_ngin/data/quote_provider.hpp"
#include "options_ngin/data/synthetic_quote_provider.hpp"
#include "options_ngin/pricing/option_pricer.hpp"

using namespace options_ngin;
using namespace options_ngin::testing;

namespace {

class FailingQuoteProvider : public QuoteProvider {
public:
    Result<std::vector<OptionQuote>> fetch_quotes(const Bar&,
                                                  const std::vector<OptionContract>&) override {
        ++calls;
        return make_error<std::vector<OptionQuote>>(ErrorCode::MARKET_DATA_ERROR,
                                                    "upstream timeout", "FailingQuoteProvider");
    }

    int calls{0};
};

}  // namespace

class QuoteProviderTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        now = at("2025-06-02 15:00:00");
        expiry = at("2025-06-10 20:00:00");
    }

    OptionQuote make_quote(double strike, double last) const {
        OptionQuote q;
        q.type = OptionType::CALL;
        q.strike = strike;
        q.expiration = expiry;
        q.last = last;
        return q;
    }

    Timestamp now;
    Timestamp expiry;
};

TEST_F(QuoteProviderTest, InMemoryReturnsLatestSnapshotAtOrBeforeBar) {
    InMemoryQuoteProvider provider;
    provider.add_snapshot(now, {make_quote(6000.0, 10.0)});
    provider.add_snapshot(plus_minutes(now, 60.0), {make_quote(6000.0, 12.0)});
    EXPECT_EQ(provider.snapshot_count(), 2u);

    auto before = provider.fetch_quotes(make_bar(plus_minutes(now, -30.0), 6000.0), {});
    ASSERT_TRUE(before.is_ok());
    EXPECT_TRUE(before.value().empty());

    auto exact = provider.fetch_quotes(make_bar(now, 6000.0), {});
    ASSERT_EQ(exact.value().size(), 1u);
    EXPECT_DOUBLE_EQ(exact.value()[0].last, 10.0);

    auto between = provider.fetch_quotes(make_bar(plus_minutes(now, 30.0), 6000.0), {});
    EXPECT_DOUBLE_EQ(between.value()[0].last, 10.0);

    auto after = provider.fetch_quotes(make_bar(plus_minutes(now, 90.0), 6000.0), {});
    EXPECT_DOUBLE_EQ(after.value()[0].last, 12.0);
}

TEST_F(QuoteProviderTest, InMemoryGroupsStampedQuotes) {
    InMemoryQuoteProvider provider;
    std::vector<std::pair<Timestamp, OptionQuote>> stamped = {{now, make_quote(6000.0, 10.0)},
                                                              {now, make_quote(6050.0, 4.0)}};
    provider.add_quotes(stamped);

    EXPECT_EQ(provider.snapshot_count(), 1u);
    EXPECT_EQ(provider.fetch_quotes(make_bar(now, 6000.0), {}).value().size(), 2u);
}

TEST_F(QuoteProviderTest, InMemorySolvesMissingImpliedVolatility) {
    OptionPricer pricer;
    double t = years_between(now, expiry);
    double model = pricer.price(6000.0, 6050.0, t, 0.25, 0.05, OptionType::CALL);

    OptionQuote recorded = make_quote(6000.0, 10.0);
    recorded.implied_volatility = 0.31;

    InMemoryQuoteProvider provider(0.05);
    provider.add_snapshot(now, {make_quote(6050.0, model), recorded, make_quote(6100.0, 0.0)});

    auto result = provider.fetch_quotes(make_bar(now, 6000.0), {});
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_NEAR(result.value()[0].implied_volatility, 0.25, 1e-4);
    EXPECT_DOUBLE_EQ(result.value()[1].implied_volatility, 0.31);
    // No mark to solve from
    EXPECT_DOUBLE_EQ(result.value()[2].implied_volatility, 0.0);

    // Stored snapshots are left as recorded
    auto again = provider.fetch_quotes(make_bar(now, 6000.0), {});
    EXPECT_NEAR(again.value()[0].implied_volatility, 0.25, 1e-4);
}

TEST_F(QuoteProviderTest, SyntheticQuotesStraddleModelPrice) {
    SyntheticQuoteProvider provider;
    OptionContract contract(OptionType::PUT, 5900.0, expiry);

    auto result = provider.fetch_quotes(make_bar(now, 6000.0), {contract});
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);

    const OptionQuote& q = result.value()[0];
    OptionPricer pricer;
    double model = pricer.price(6000.0, 5900.0, years_between(now, expiry), 0.2, 0.05,
                                OptionType::PUT);
    EXPECT_DOUBLE_EQ(q.last, model);
    EXPECT_LT(q.bid, q.last);
    EXPECT_GT(q.ask, q.last);
    EXPECT_NEAR(q.mid(), q.last, 1e-9);
    EXPECT_EQ(q.contract(), contract);
    EXPECT_DOUBLE_EQ(q.implied_volatility, 0.2);
}

TEST_F(QuoteProviderTest, SyntheticBidNeverNegative) {
    SyntheticQuoteProvider provider;
    OptionQuote q = provider.quote(OptionContract(OptionType::CALL, 9000.0, expiry), 6000.0, now);
    EXPECT_DOUBLE_EQ(q.last, OptionPricer::MIN_PRICE);
    EXPECT_GE(q.bid, 0.0);
}

TEST_F(QuoteProviderTest, SyntheticRejectsBadClose) {
    SyntheticQuoteProvider provider;
    auto result = provider.fetch_quotes(make_bar(now, 0.0), {});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::MARKET_DATA_ERROR);
}

TEST_F(QuoteProviderTest, FallbackUsesNextProviderOnFailure) {
    auto failing = std::make_shared<FailingQuoteProvider>();
    auto memory = std::make_shared<InMemoryQuoteProvider>();
    memory->add_snapshot(now, {make_quote(6000.0, 10.0)});

    std::vector<ProviderEntry> entries = {{"primary", failing, 0}, {"backup", memory, 0}};
    FallbackQuoteProvider provider(entries);
    auto result = provider.fetch_quotes(make_bar(now, 6000.0), {});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().size(), 1u);
    EXPECT_EQ(failing->calls, 1);
    EXPECT_EQ(provider.requests_made(0), 1);
    EXPECT_EQ(provider.requests_made(1), 1);
}

TEST_F(QuoteProviderTest, FallbackSkipsRateLimitedProvider) {
    auto primary = std::make_shared<InMemoryQuoteProvider>();
    primary->add_snapshot(now, {make_quote(6000.0, 10.0)});
    auto backup = std::make_shared<InMemoryQuoteProvider>();
    backup->add_snapshot(now, {make_quote(6000.0, 11.0)});

    std::vector<ProviderEntry> entries = {{"primary", primary, 2}, {"backup", backup, 0}};
    FallbackQuoteProvider provider(entries);
    Bar bar = make_bar(now, 6000.0);

    EXPECT_DOUBLE_EQ(provider.fetch_quotes(bar, {}).value()[0].last, 10.0);
    EXPECT_DOUBLE_EQ(provider.fetch_quotes(bar, {}).value()[0].last, 10.0);
    EXPECT_DOUBLE_EQ(provider.fetch_quotes(bar, {}).value()[0].last, 11.0);
    EXPECT_EQ(provider.requests_made(0), 2);

    provider.reset_rate_limits();
    EXPECT_EQ(provider.requests_made(0), 0);
    EXPECT_DOUBLE_EQ(provider.fetch_quotes(bar, {}).value()[0].last, 10.0);
}

TEST_F(QuoteProviderTest, FallbackReportsExhaustion) {
    auto failing = std::make_shared<FailingQuoteProvider>();
    std::vector<ProviderEntry> entries = {{"only", failing, 1}};
    FallbackQuoteProvider provider(entries);
    Bar bar = make_bar(now, 6000.0);

    auto failed = provider.fetch_quotes(bar, {});
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error()->code(), ErrorCode::MARKET_DATA_ERROR);

    auto limited = provider.fetch_quotes(bar, {});
    ASSERT_TRUE(limited.is_error());
    EXPECT_EQ(limited.error()->code(), ErrorCode::RATE_LIMITED);
    EXPECT_EQ(failing->calls, 1);
}
