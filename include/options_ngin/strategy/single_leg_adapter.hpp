// include/options_ngin/strategy/single_leg_adapter.hpp
#pragma once

#include "options_ngin/strategy/base_backtesting_adapter.hpp"

namespace options_ngin {

/**
 * @brief Configuration for the single-leg directional adapter
 */
struct SingleLegConfig : public AdapterConfig {
    double strike_increment{5.0};
    int strikes_each_side{2};              // Strikes requested around the money
    double option_lifetime_minutes{240.0};  // Expiry of the contracts bought
    double stop_loss_percent{50.0};         // Of entry premium; 0 uses exits.max_loss
    double take_profit_percent{100.0};      // Of entry premium; 0 uses exits.profit_target

    SingleLegConfig();

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Buys one call or put per signal, in the signal's direction
 *
 * Profit target and stop loss are set at entry as a share of the premium
 * paid unless the signal supplies dollar values.
 */
class SingleLegAdapter : public BaseBacktestingAdapter {
public:
    explicit SingleLegAdapter(SingleLegConfig config = SingleLegConfig());

    std::vector<OptionContract> required_contracts(double underlying_price,
                                                   const Timestamp& time) const override;

    bool accepts_signal(const Signal& signal) const override;

    Result<Position> build_position(const Signal& signal, const std::vector<OptionQuote>& quotes,
                                    double underlying_price) override;

    const SingleLegConfig& config() const {
        return config_;
    }

protected:
    Result<void> validate_strategy() const override;

    void add_strategy_metrics(const std::vector<Trade>& trades, const std::vector<Signal>& signals,
                              StrategyMetrics& metrics) const override;

private:
    double at_the_money(double underlying_price) const;
    Timestamp expiry_from(const Timestamp& time) const;

    SingleLegConfig config_;
};

}  // namespace options_ngin
