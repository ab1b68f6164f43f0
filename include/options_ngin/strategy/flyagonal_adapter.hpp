// include/options_ngin/strategy/flyagonal_adapter.hpp
#pragma once

#include "options_ngin/strategy/base_backtesting_adapter.hpp"

namespace options_ngin {

/**
 * @brief Configuration for the flyagonal adapter
 *
 * Strike layout for underlying S:
 *   call butterfly  L = ceil(S / strike_rounding) * strike_rounding + call_entry_offset,
 *                   short 2x at L + short_call_width, long at that + upper_call_width
 *   put diagonal    short at floor(S * (1 - diagonal_percent_below / 100) / diagonal_rounding)
 *                   * diagonal_rounding, long diagonal_protection_width lower
 */
struct FlyagonalConfig : public AdapterConfig {
    double strike_rounding{10.0};
    double call_entry_offset{10.0};
    double short_call_width{50.0};
    double upper_call_width{60.0};
    double diagonal_percent_below{3.0};
    double diagonal_rounding{5.0};
    double diagonal_protection_width{50.0};
    int short_expiry_days{8};
    int long_expiry_days{16};
    double profit_zone_threshold{200.0};  // Width counted as an efficient signal

    FlyagonalConfig();

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Strikes and expirations of one flyagonal entry
 */
struct FlyagonalLayout {
    double lower_call{0.0};
    double short_call{0.0};
    double upper_call{0.0};
    double short_put{0.0};
    double long_put{0.0};
    Timestamp short_expiry;
    Timestamp long_expiry;
};

/**
 * @brief Call broken-wing butterfly above the market combined with a put
 *        diagonal below it
 */
class FlyagonalAdapter : public BaseBacktestingAdapter {
public:
    explicit FlyagonalAdapter(FlyagonalConfig config = FlyagonalConfig());

    FlyagonalLayout layout(double underlying_price, const Timestamp& time) const;

    std::vector<OptionContract> required_contracts(double underlying_price,
                                                   const Timestamp& time) const override;

    Result<Position> build_position(const Signal& signal, const std::vector<OptionQuote>& quotes,
                                    double underlying_price) override;

    const FlyagonalConfig& config() const {
        return config_;
    }

protected:
    Result<void> validate_strategy() const override;

    void add_strategy_metrics(const std::vector<Trade>& trades, const std::vector<Signal>& signals,
                              StrategyMetrics& metrics) const override;

private:
    FlyagonalConfig config_;
};

}  // namespace options_ngin
