// include/options_ngin/strategy/base_backtesting_adapter.hpp
#pragma once

#include <memory>
#include <random>
#include <string>
#include <vector>
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/core/logger.hpp"
#include "options_ngin/strategy/backtesting_adapter.hpp"
#include "options_ngin/strategy/exit_rules.hpp"

namespace options_ngin {

/**
 * @brief Price at which a leg is filled at entry
 */
enum class FillModel {
    MARK,          // Last trade, else midpoint
    CROSS_SPREAD   // Ask for longs, bid for shorts
};

/**
 * @brief Settings shared by every adapter
 */
struct AdapterConfig : public ConfigBase {
    std::string underlying_symbol{"SPX"};
    ExitThresholds exits;
    double min_confidence{0.0};             // Signals below this are ignored
    double contract_multiplier{100.0};
    double expiration_tolerance_days{1.0};  // Quote matching window
    double estimation_volatility{0.20};     // For legs without quotes
    double risk_free_rate{0.05};
    FillModel fill_model{FillModel::MARK};
    double slippage_percent{0.0};  // Longs pay more, shorts receive less

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief One leg an adapter wants to open
 */
struct LegRequest {
    OptionContract contract;
    LegSide side{LegSide::LONG};
    int quantity{1};
};

/**
 * @brief Shared adapter machinery: validation, fills, marking, exits and
 *        the common part of the strategy metrics
 */
class BaseBacktestingAdapter : public BacktestingAdapter {
public:
    BaseBacktestingAdapter(std::string name, const AdapterConfig& config);

    const std::string& name() const override {
        return name_;
    }

    Result<void> validate() const override;

    void set_valuation_mode(ValuationMode mode, uint64_t seed) override;

    bool accepts_signal(const Signal& signal) const override;

    Position update_position(const Position& position, const Bar& bar,
                             const std::vector<OptionQuote>& quotes) override;

    /**
     * @brief Exit using the profit target and max loss stored on the position
     *        and the configured holding limits
     */
    std::optional<ExitReason> should_exit(const Position& position, const Bar& bar,
                                          const std::vector<OptionQuote>& quotes,
                                          double holding_minutes) const override;

    StrategyMetrics strategy_metrics(const std::vector<Trade>& trades,
                                     const std::vector<Signal>& signals) const override;

    ValuationMode valuation_mode() const {
        return valuation_mode_;
    }

protected:
    /**
     * @brief Fill every requested leg from quotes and open the position
     * @return DATA_GAP naming the first leg without a usable quote
     */
    Result<Position> assemble_position(const Signal& signal,
                                       const std::vector<LegRequest>& requests,
                                       const std::vector<OptionQuote>& quotes,
                                       double underlying_price, PositionMetadata metadata);

    /**
     * @brief Per-share fill price for a side under the configured fill model,
     *        after slippage
     */
    double fill_price(const OptionQuote& quote, LegSide side) const;

    /**
     * @brief Hook for strategy-specific entries in strategy_metrics
     */
    virtual void add_strategy_metrics(const std::vector<Trade>& trades,
                                      const std::vector<Signal>& signals,
                                      StrategyMetrics& metrics) const = 0;

    const AdapterConfig& base_config() const {
        return config_;
    }

    /**
     * @brief Strategy-specific parameter checks, run after the shared ones
     */
    virtual Result<void> validate_strategy() const {
        return Result<void>();
    }

    PositionValuer valuer_;

private:
    std::string name_;
    AdapterConfig config_;
    ValuationMode valuation_mode_{ValuationMode::DETERMINISTIC};
    std::mt19937_64 rng_;
    std::normal_distribution<double> noise_{0.0, 0.10};
    size_t next_position_id_{1};
};

}  // namespace options_ngin
