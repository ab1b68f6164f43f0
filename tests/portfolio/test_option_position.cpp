#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "options_ngin/portfolio/option_position.hpp"

using namespace options_ngin;
using namespace options_ngin::testing;

class OptionPositionTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        now = at("2025-03-03 15:00:00");
        expiry = at("2025-03-11 20:00:00");
    }

    OptionQuote quote(OptionType type, double strike, const Timestamp& exp, double bid,
                      double ask, double last) const {
        OptionQuote q;
        q.type = type;
        q.strike = strike;
        q.expiration = exp;
        q.bid = bid;
        q.ask = ask;
        q.last = last;
        return q;
    }

    Position spread() const {
        std::vector<PositionLeg> legs;
        legs.emplace_back(OptionContract(OptionType::CALL, 6000.0, expiry), LegSide::LONG, 1,
                          40.0);
        legs.emplace_back(OptionContract(OptionType::CALL, 6050.0, expiry), LegSide::SHORT, 1,
                          25.0);
        auto result = open_position("test-1", "SPX", legs, now, 100.0, PositionMetadata());
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? result.value() : Position();
    }

    Timestamp now;
    Timestamp expiry;
};

TEST_F(OptionPositionTest, EntryCostIsSignedPremiumTimesMultiplier) {
    Position position = spread();
    EXPECT_DOUBLE_EQ(position.entry_cost, (40.0 - 25.0) * 100.0);
    EXPECT_DOUBLE_EQ(position.current_value, position.entry_cost);
    EXPECT_DOUBLE_EQ(position.unrealized_pnl, 0.0);
    EXPECT_FALSE(position.is_net_credit());
    EXPECT_EQ(position.legs[1].current_price, 25.0);
}

TEST_F(OptionPositionTest, CreditPositionHasNegativeCost) {
    std::vector<PositionLeg> legs;
    legs.emplace_back(OptionContract(OptionType::PUT, 5900.0, expiry), LegSide::SHORT, 2, 12.0);
    auto result = open_position("credit", "SPX", legs, now, 100.0, PositionMetadata());
    ASSERT_TRUE(result.is_ok());
    EXPECT_DOUBLE_EQ(result.value().entry_cost, -2400.0);
    EXPECT_TRUE(result.value().is_net_credit());
}

TEST_F(OptionPositionTest, OpenRejectsInvalidLegs) {
    auto empty = open_position("e", "SPX", {}, now, 100.0, PositionMetadata());
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error()->code(), ErrorCode::INVALID_ARGUMENT);

    std::vector<PositionLeg> zero_qty;
    zero_qty.emplace_back(OptionContract(OptionType::CALL, 6000.0, expiry), LegSide::LONG, 0,
                          10.0);
    EXPECT_TRUE(open_position("z", "SPX", zero_qty, now, 100.0, PositionMetadata()).is_error());

    std::vector<PositionLeg> negative_price;
    negative_price.emplace_back(OptionContract(OptionType::CALL, 6000.0, expiry), LegSide::LONG,
                                1, -1.0);
    EXPECT_TRUE(
        open_position("n", "SPX", negative_price, now, 100.0, PositionMetadata()).is_error());

    std::vector<PositionLeg> ok;
    ok.emplace_back(OptionContract(OptionType::CALL, 6000.0, expiry), LegSide::LONG, 1, 10.0);
    EXPECT_TRUE(open_position("m", "SPX", ok, now, 0.0, PositionMetadata()).is_error());
}

TEST_F(OptionPositionTest, MarkUsesLastThenMid) {
    Position position = spread();
    PositionValuer valuer(ValuationParams{});

    std::vector<OptionQuote> quotes = {
        quote(OptionType::CALL, 6000.0, expiry, 49.0, 51.0, 52.0),
        quote(OptionType::CALL, 6050.0, expiry, 29.0, 31.0, 0.0),
    };

    Timestamp later = plus_minutes(now, 60.0);
    size_t estimated = valuer.mark_to_market(position, quotes, 6040.0, later);

    EXPECT_EQ(estimated, 0u);
    EXPECT_DOUBLE_EQ(position.legs[0].current_price, 52.0);
    EXPECT_DOUBLE_EQ(position.legs[1].current_price, 30.0);
    EXPECT_DOUBLE_EQ(position.current_value, (52.0 - 30.0) * 100.0);
    EXPECT_DOUBLE_EQ(position.unrealized_pnl, 700.0);
    EXPECT_DOUBLE_EQ(position.peak_pnl, 700.0);
    EXPECT_DOUBLE_EQ(position.trough_pnl, 0.0);
    EXPECT_EQ(position.last_update, later);
    EXPECT_FALSE(position.estimated);
    EXPECT_DOUBLE_EQ(position.holding_minutes(later), 60.0);
}

TEST_F(OptionPositionTest, MatchesExpirationWithinTolerance) {
    Position position = spread();
    PositionValuer valuer(ValuationParams{});

    Timestamp shifted = plus_minutes(expiry, 600.0);
    std::vector<OptionQuote> quotes = {
        quote(OptionType::CALL, 6000.0, shifted, 0.0, 0.0, 45.0),
        quote(OptionType::CALL, 6050.0, expiry, 0.0, 0.0, 20.0),
    };

    EXPECT_EQ(valuer.mark_to_market(position, quotes, 6010.0, now), 0u);
    EXPECT_DOUBLE_EQ(position.legs[0].current_price, 45.0);
}

TEST_F(OptionPositionTest, MissingQuoteIsEstimatedAndFlagged) {
    Position position = spread();
    PositionValuer valuer(ValuationParams{});

    std::vector<OptionQuote> quotes = {
        quote(OptionType::CALL, 6000.0, expiry, 0.0, 0.0, 45.0),
    };

    size_t estimated = valuer.mark_to_market(position, quotes, 6010.0, now);
    EXPECT_EQ(estimated, 1u);
    EXPECT_FALSE(position.legs[0].estimated);
    EXPECT_TRUE(position.legs[1].estimated);
    EXPECT_TRUE(position.estimated);
    EXPECT_DOUBLE_EQ(position.legs[1].current_price,
                     valuer.estimate_leg_price(position.legs[1].contract, 6010.0, now));
}

TEST_F(OptionPositionTest, QuoteOutsideToleranceIsIgnored) {
    Position position = spread();
    PositionValuer valuer(ValuationParams{});

    Timestamp far = plus_minutes(expiry, 3.0 * MINUTES_PER_DAY);
    std::vector<OptionQuote> quotes = {
        quote(OptionType::CALL, 6000.0, far, 0.0, 0.0, 45.0),
        quote(OptionType::PUT, 6050.0, expiry, 0.0, 0.0, 20.0),
    };

    EXPECT_EQ(valuer.mark_to_market(position, quotes, 6010.0, now), 2u);
}

TEST_F(OptionPositionTest, EstimateAdjustmentIsFloored) {
    Position position = spread();
    PositionValuer valuer(ValuationParams{});

    valuer.mark_to_market(position, {}, 6010.0, now, [](double) { return -5.0; });
    EXPECT_DOUBLE_EQ(position.legs[0].current_price, OptionPricer::MIN_PRICE);
    EXPECT_DOUBLE_EQ(position.legs[1].current_price, OptionPricer::MIN_PRICE);
}

TEST_F(OptionPositionTest, TroughTracksWorstMark) {
    Position position = spread();
    PositionValuer valuer(ValuationParams{});

    valuer.mark_to_market(position,
                          {quote(OptionType::CALL, 6000.0, expiry, 0.0, 0.0, 30.0),
                           quote(OptionType::CALL, 6050.0, expiry, 0.0, 0.0, 20.0)},
                          5980.0, now);
    EXPECT_DOUBLE_EQ(position.unrealized_pnl, -500.0);

    valuer.mark_to_market(position,
                          {quote(OptionType::CALL, 6000.0, expiry, 0.0, 0.0, 45.0),
                           quote(OptionType::CALL, 6050.0, expiry, 0.0, 0.0, 26.0)},
                          6010.0, now);
    EXPECT_DOUBLE_EQ(position.unrealized_pnl, 400.0);
    EXPECT_DOUBLE_EQ(position.trough_pnl, -500.0);
    EXPECT_DOUBLE_EQ(position.peak_pnl, 400.0);
}

TEST_F(OptionPositionTest, FindQuotePrefersClosestExpiration) {
    Timestamp near = plus_minutes(expiry, 120.0);
    Timestamp nearer = plus_minutes(expiry, -30.0);
    std::vector<OptionQuote> quotes = {
        quote(OptionType::PUT, 5900.0, near, 1.0, 2.0, 0.0),
        quote(OptionType::PUT, 5900.0, nearer, 3.0, 4.0, 0.0),
    };

    const OptionQuote* found =
        find_quote(quotes, OptionContract(OptionType::PUT, 5900.0, expiry), 1.0);
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->expiration, nearer);

    EXPECT_EQ(find_quote(quotes, OptionContract(OptionType::PUT, 5905.0, expiry), 1.0), nullptr);
}

TEST_F(OptionPositionTest, ButterflyOpensAsSmallNetDebit) {
    OptionPricer pricer;
    double t = years_between(now, expiry);
    double lower = pricer.price(6360.0, 6370.0, t, 0.2, 0.05, OptionType::CALL);
    double middle = pricer.price(6360.0, 6420.0, t, 0.2, 0.05, OptionType::CALL);
    double upper = pricer.price(6360.0, 6480.0, t, 0.2, 0.05, OptionType::CALL);

    std::vector<PositionLeg> legs;
    legs.emplace_back(OptionContract(OptionType::CALL, 6370.0, expiry), LegSide::LONG, 1, lower);
    legs.emplace_back(OptionContract(OptionType::CALL, 6420.0, expiry), LegSide::SHORT, 2,
                      middle);
    legs.emplace_back(OptionContract(OptionType::CALL, 6480.0, expiry), LegSide::LONG, 1, upper);
    auto result = open_position("fly", "SPX", legs, now, 100.0, PositionMetadata());
    ASSERT_TRUE(result.is_ok()) << result.error()->to_string();

    const Position& fly = result.value();
    EXPECT_NEAR(fly.entry_cost, (lower - 2.0 * middle + upper) * 100.0, 1e-9);
    EXPECT_GT(fly.entry_cost, 0.0);
    EXPECT_LT(fly.entry_cost, lower * 100.0);
    EXPECT_FALSE(fly.is_net_credit());
}

TEST_F(OptionPositionTest, PositionGreeksSumSignedLegs) {
    std::vector<PositionLeg> legs;
    legs.emplace_back(OptionContract(OptionType::CALL, 6370.0, expiry), LegSide::LONG, 1, 60.0);
    legs.emplace_back(OptionContract(OptionType::CALL, 6420.0, expiry), LegSide::SHORT, 2, 40.0);
    legs.emplace_back(OptionContract(OptionType::CALL, 6480.0, expiry), LegSide::LONG, 1, 22.0);
    auto result = open_position("fly", "SPX", legs, now, 100.0, PositionMetadata());
    ASSERT_TRUE(result.is_ok());

    PositionValuer valuer{ValuationParams()};
    Greeks total = valuer.position_greeks(result.value(), 6360.0, now);

    OptionPricer pricer;
    double expected_delta = 0.0;
    double expected_vega = 0.0;
    double lower_call_delta = 0.0;
    for (const auto& leg : result.value().legs) {
        PricingInputs in;
        in.underlying = 6360.0;
        in.strike = leg.contract.strike;
        in.time_to_expiry = years_between(now, expiry);
        in.volatility = 0.20;
        in.rate = 0.05;
        in.type = OptionType::CALL;
        Greeks g = pricer.greeks(in);
        expected_delta += side_sign(leg.side) * leg.quantity * 100.0 * g.delta;
        expected_vega += side_sign(leg.side) * leg.quantity * 100.0 * g.vega;
        if (leg.contract.strike == 6370.0) {
            lower_call_delta = 100.0 * g.delta;
        }
    }

    EXPECT_NEAR(total.delta, expected_delta, 1e-9);
    EXPECT_NEAR(total.vega, expected_vega, 1e-9);
    // Below the body the butterfly gains as the underlying rises, far less
    // than the lower call alone
    EXPECT_GT(total.delta, 0.0);
    EXPECT_LT(total.delta, lower_call_delta);
}

TEST_F(OptionPositionTest, PositionGreeksUseQuotedImpliedVolatility) {
    std::vector<PositionLeg> legs;
    legs.emplace_back(OptionContract(OptionType::PUT, 5900.0, expiry), LegSide::SHORT, 1, 20.0);
    auto result = open_position("put", "SPX", legs, now, 100.0, PositionMetadata());
    ASSERT_TRUE(result.is_ok());

    OptionQuote q = quote(OptionType::PUT, 5900.0, expiry, 19.0, 21.0, 20.0);
    q.implied_volatility = 0.35;

    PositionValuer valuer{ValuationParams()};
    Greeks quoted = valuer.position_greeks(result.value(), 6000.0, now, {q});
    Greeks estimated = valuer.position_greeks(result.value(), 6000.0, now);

    PricingInputs in;
    in.underlying = 6000.0;
    in.strike = 5900.0;
    in.time_to_expiry = years_between(now, expiry);
    in.volatility = 0.35;
    in.rate = 0.05;
    in.type = OptionType::PUT;
    Greeks leg = OptionPricer().greeks(in);

    EXPECT_NEAR(quoted.vega, -100.0 * leg.vega, 1e-9);
    EXPECT_NEAR(quoted.delta, -100.0 * leg.delta, 1e-9);
    // Short put: positive delta, negative gamma
    EXPECT_GT(quoted.delta, 0.0);
    EXPECT_LT(quoted.gamma, 0.0);
    EXPECT_NE(quoted.vega, estimated.vega);
}
