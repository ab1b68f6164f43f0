#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "../core/test_base.hpp"
#include "options_ngin/pricing/option_pricer.hpp"

using namespace options_ngin;
using namespace options_ngin::testing;

class OptionPricerTest : public TestBase {
protected:
    PricingInputs inputs(double s, double k, double t, double vol, OptionType type) const {
        PricingInputs in;
        in.underlying = s;
        in.strike = k;
        in.time_to_expiry = t;
        in.volatility = vol;
        in.rate = 0.05;
        in.type = type;
        return in;
    }

    OptionPricer pricer;
};

TEST_F(OptionPricerTest, ReferenceValues) {
    EXPECT_NEAR(pricer.price(100.0, 100.0, 1.0, 0.2, 0.05, OptionType::CALL), 10.4506, 1e-3);
    EXPECT_NEAR(pricer.price(100.0, 100.0, 1.0, 0.2, 0.05, OptionType::PUT), 5.5735, 1e-3);
}

TEST_F(OptionPricerTest, PutCallParity) {
    double s = 6360.0, k = 6400.0, t = 30.0 / 365.0, r = 0.05;
    double call = pricer.price(s, k, t, 0.18, r, OptionType::CALL);
    double put = pricer.price(s, k, t, 0.18, r, OptionType::PUT);
    EXPECT_NEAR(call - put, s - k * std::exp(-r * t), 1e-6);
}

TEST_F(OptionPricerTest, PriceNeverBelowFloor) {
    double deep_otm = pricer.price(6000.0, 9000.0, 1.0 / 365.0, 0.1, 0.05, OptionType::CALL);
    EXPECT_DOUBLE_EQ(deep_otm, OptionPricer::MIN_PRICE);

    double expired_otm = pricer.price(6000.0, 6100.0, 0.0, 0.2, 0.05, OptionType::CALL);
    EXPECT_DOUBLE_EQ(expired_otm, OptionPricer::MIN_PRICE);
}

TEST_F(OptionPricerTest, ExpiredOptionIsIntrinsic) {
    EXPECT_DOUBLE_EQ(pricer.price(6100.0, 6000.0, 0.0, 0.2, 0.05, OptionType::CALL), 100.0);
    EXPECT_DOUBLE_EQ(pricer.price(5950.0, 6000.0, 0.0, 0.2, 0.05, OptionType::PUT), 50.0);

    Greeks g = pricer.greeks(inputs(6100.0, 6000.0, 0.0, 0.2, OptionType::CALL));
    EXPECT_DOUBLE_EQ(g.delta, 1.0);
    EXPECT_DOUBLE_EQ(g.gamma, 0.0);

    Greeks put = pricer.greeks(inputs(6100.0, 6000.0, 0.0, 0.2, OptionType::PUT));
    EXPECT_DOUBLE_EQ(put.delta, 0.0);
}

TEST_F(OptionPricerTest, ValueApproachesIntrinsicNearExpiry) {
    double near = pricer.price(6100.0, 6000.0, 1e-8, 0.2, 0.05, OptionType::CALL);
    EXPECT_NEAR(near, 100.0, 0.01);
}

TEST_F(OptionPricerTest, DegenerateVolatilityIsClamped) {
    double zero_vol = pricer.price(6100.0, 6000.0, 0.1, 0.0, 0.0, OptionType::CALL);
    EXPECT_TRUE(std::isfinite(zero_vol));
    EXPECT_NEAR(zero_vol, 100.0, 0.01);

    double nan_vol = pricer.price(6100.0, 6000.0, 0.1, std::numeric_limits<double>::quiet_NaN(),
                                  0.0, OptionType::CALL);
    EXPECT_TRUE(std::isfinite(nan_vol));
}

TEST_F(OptionPricerTest, InvalidUnderlyingDegradesToFloor) {
    PricingResult result = pricer.evaluate(inputs(0.0, 6000.0, 0.1, 0.2, OptionType::CALL));
    EXPECT_TRUE(result.degraded);
    EXPECT_DOUBLE_EQ(result.price, OptionPricer::MIN_PRICE);
}

TEST_F(OptionPricerTest, GreeksBehaveAsExpected) {
    Greeks call = pricer.greeks(inputs(6000.0, 6000.0, 30.0 / 365.0, 0.2, OptionType::CALL));
    Greeks put = pricer.greeks(inputs(6000.0, 6000.0, 30.0 / 365.0, 0.2, OptionType::PUT));

    EXPECT_GT(call.delta, 0.5);
    EXPECT_LT(call.delta, 0.6);
    EXPECT_NEAR(call.delta - put.delta, 1.0, 1e-9);
    EXPECT_GT(call.gamma, 0.0);
    EXPECT_DOUBLE_EQ(call.gamma, put.gamma);
    EXPECT_GT(call.vega, 0.0);
    EXPECT_LT(call.theta, 0.0);
    EXPECT_GT(call.rho, 0.0);
    EXPECT_LT(put.rho, 0.0);

    // Delta rises with the underlying
    double previous = -1.0;
    for (double s = 5800.0; s <= 6200.0; s += 50.0) {
        double delta = pricer.greeks(inputs(s, 6000.0, 30.0 / 365.0, 0.2, OptionType::CALL)).delta;
        EXPECT_GT(delta, previous);
        previous = delta;
    }

    // Put delta falls toward -1 as the underlying drops and stays in [-1, 0]
    previous = 0.0;
    for (double s = 6200.0; s >= 5800.0; s -= 50.0) {
        double delta = pricer.greeks(inputs(s, 6000.0, 30.0 / 365.0, 0.2, OptionType::PUT)).delta;
        EXPECT_LE(delta, previous) << "underlying " << s;
        EXPECT_GE(delta, -1.0);
        previous = delta;
    }
}

TEST_F(OptionPricerTest, ThetaIsPerCalendarDay) {
    PricingInputs in = inputs(6000.0, 6000.0, 30.0 / 365.0, 0.2, OptionType::CALL);
    double today = pricer.evaluate(in).price;
    in.time_to_expiry = 29.0 / 365.0;
    double tomorrow = pricer.evaluate(in).price;

    Greeks g = pricer.greeks(inputs(6000.0, 6000.0, 30.0 / 365.0, 0.2, OptionType::CALL));
    EXPECT_NEAR(tomorrow - today, g.theta, std::fabs(g.theta) * 0.05);
}

TEST_F(OptionPricerTest, EstimateScalesWithMoneyness) {
    double t = 8.0 / 365.0;
    PricingResult atm = pricer.estimate(6000.0, 6000.0, t, 0.2, OptionType::CALL);
    EXPECT_TRUE(atm.degraded);
    EXPECT_NEAR(atm.price, 0.4 * 6000.0 * 0.2 * std::sqrt(t), 1e-9);

    PricingResult otm_call = pricer.estimate(6000.0, 7500.0, t, 0.2, OptionType::CALL);
    EXPECT_NEAR(otm_call.price, 0.4 * 6000.0 * 0.2 * std::sqrt(t) * 0.8, 1e-9);

    PricingResult itm_put = pricer.estimate(6000.0, 6100.0, t, 0.2, OptionType::PUT);
    EXPECT_NEAR(itm_put.intrinsic, 100.0, 1e-12);
    EXPECT_GT(itm_put.price, 100.0);

    PricingResult expired = pricer.estimate(6000.0, 6100.0, 0.0, 0.2, OptionType::CALL);
    EXPECT_DOUBLE_EQ(expired.price, OptionPricer::MIN_PRICE);
}

TEST_F(OptionPricerTest, ImpliedVolatilityRecoversInput) {
    double t = 45.0 / 365.0;
    for (double vol : {0.08, 0.2, 0.65}) {
        double market = pricer.price(6000.0, 6150.0, t, vol, 0.05, OptionType::CALL);
        auto iv = pricer.implied_volatility(market, 6000.0, 6150.0, t, 0.05, OptionType::CALL);
        ASSERT_TRUE(iv.is_ok()) << iv.error()->to_string();
        EXPECT_NEAR(iv.value(), vol, 1e-4);
    }

    double put_market = pricer.price(6000.0, 5800.0, t, 0.3, 0.05, OptionType::PUT);
    auto put_iv = pricer.implied_volatility(put_market, 6000.0, 5800.0, t, 0.05, OptionType::PUT);
    ASSERT_TRUE(put_iv.is_ok());
    EXPECT_NEAR(put_iv.value(), 0.3, 1e-4);
}

TEST_F(OptionPricerTest, ImpliedVolatilityRejectsUnattainablePrice) {
    double t = 30.0 / 365.0;
    auto below_intrinsic =
        pricer.implied_volatility(50.0, 6100.0, 6000.0, t, 0.05, OptionType::CALL);
    ASSERT_TRUE(below_intrinsic.is_error());
    EXPECT_EQ(below_intrinsic.error()->code(), ErrorCode::INVALID_ARGUMENT);

    auto above_spot = pricer.implied_volatility(7000.0, 6000.0, 6000.0, t, 0.05, OptionType::CALL);
    EXPECT_TRUE(above_spot.is_error());

    auto zero_time = pricer.implied_volatility(10.0, 6000.0, 6000.0, 0.0, 0.05, OptionType::CALL);
    EXPECT_EQ(zero_time.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(OptionPricerTest, ButterflyCostsANetDebit) {
    double t = 8.0 / 365.0;
    double lower = pricer.price(6360.0, 6370.0, t, 0.2, 0.05, OptionType::CALL);
    double middle = pricer.price(6360.0, 6420.0, t, 0.2, 0.05, OptionType::CALL);
    double upper = pricer.price(6360.0, 6480.0, t, 0.2, 0.05, OptionType::CALL);

    double debit = lower - 2.0 * middle + upper;
    EXPECT_GT(debit, 0.0);
    EXPECT_LT(debit, lower);
}
