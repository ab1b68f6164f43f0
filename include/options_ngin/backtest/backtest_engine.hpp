// include/options_ngin/backtest/backtest_engine.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "options_ngin/backtest/backtest_metrics_calculator.hpp"
#include "options_ngin/core/config_base.hpp"
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"
#include "options_ngin/data/quote_provider.hpp"
#include "options_ngin/data/signal_generator.hpp"
#include "options_ngin/strategy/backtesting_adapter.hpp"

namespace options_ngin {
namespace backtest {

/**
 * @brief Run-level backtest configuration
 */
struct BacktestConfig : public ConfigBase {
    std::string symbol{"SPX"};
    double initial_capital{100000.0};
    int warmup_bars{0};               // Bars skipped before trading starts
    int max_concurrent_positions{1};
    int min_bars_between_entries{0};  // Gap required since the previous entry
    double risk_free_rate{0.05};
    double commission_per_contract{0.0};  // Charged per contract at entry and at exit
    double periods_per_year{252.0};   // Bars per year, for annualized ratios
    ValuationMode valuation_mode{ValuationMode::DETERMINISTIC};
    uint64_t seed{42};
    std::string output_directory{"results"};
    bool store_trade_details{true};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["symbol"] = symbol;
        j["initial_capital"] = initial_capital;
        j["warmup_bars"] = warmup_bars;
        j["max_concurrent_positions"] = max_concurrent_positions;
        j["min_bars_between_entries"] = min_bars_between_entries;
        j["risk_free_rate"] = risk_free_rate;
        j["commission_per_contract"] = commission_per_contract;
        j["periods_per_year"] = periods_per_year;
        j["valuation_mode"] = valuation_mode_to_string(valuation_mode);
        j["seed"] = seed;
        j["output_directory"] = output_directory;
        j["store_trade_details"] = store_trade_details;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("symbol"))
            symbol = j.at("symbol").get<std::string>();
        if (j.contains("initial_capital"))
            initial_capital = j.at("initial_capital").get<double>();
        if (j.contains("warmup_bars"))
            warmup_bars = j.at("warmup_bars").get<int>();
        if (j.contains("max_concurrent_positions"))
            max_concurrent_positions = j.at("max_concurrent_positions").get<int>();
        if (j.contains("min_bars_between_entries"))
            min_bars_between_entries = j.at("min_bars_between_entries").get<int>();
        if (j.contains("risk_free_rate"))
            risk_free_rate = j.at("risk_free_rate").get<double>();
        if (j.contains("commission_per_contract"))
            commission_per_contract = j.at("commission_per_contract").get<double>();
        if (j.contains("periods_per_year"))
            periods_per_year = j.at("periods_per_year").get<double>();
        if (j.contains("valuation_mode")) {
            valuation_mode = j.at("valuation_mode").get<std::string>() == "SEEDED_RANDOM"
                                 ? ValuationMode::SEEDED_RANDOM
                                 : ValuationMode::DETERMINISTIC;
        }
        if (j.contains("seed"))
            seed = j.at("seed").get<uint64_t>();
        if (j.contains("output_directory"))
            output_directory = j.at("output_directory").get<std::string>();
        if (j.contains("store_trade_details"))
            store_trade_details = j.at("store_trade_details").get<bool>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Mutable simulation state, owned by the engine
 */
struct BacktestState {
    double cash{0.0};           // initial capital + realized_pnl - open commitments
    double realized_pnl{0.0};   // Sum of ledger P&L in close order
    std::vector<Position> open_positions;
    std::vector<Trade> ledger;  // Append-only
    double equity_peak{0.0};
    double max_drawdown{0.0};   // Dollars
    std::vector<std::pair<Timestamp, double>> equity_curve;
    std::vector<Signal> signals;  // Every signal received, in order
    size_t signals_accepted{0};
    size_t bars_processed{0};
    size_t data_gaps{0};
    size_t estimated_marks{0};
    std::optional<size_t> last_entry_bar;
};

/**
 * @brief Outcome of a completed run
 */
struct BacktestResults {
    std::string strategy;
    double initial_capital{0.0};
    double final_cash{0.0};
    PerformanceSummary summary;
    StrategyMetrics strategy_metrics;
    std::vector<Trade> trades;
    std::vector<std::pair<Timestamp, double>> equity_curve;
    size_t bars_processed{0};
    size_t data_gaps{0};
    size_t estimated_marks{0};
    size_t signals_received{0};
    size_t signals_accepted{0};
    bool simulated{false};  // Seeded random valuation was enabled
};

/**
 * @brief Chronological, single-threaded options backtest
 *
 * Each bar: fetch quotes, mark open positions and apply exits, then consider
 * one new entry, then update equity and drawdown. Remaining positions close
 * at the final bar with END_OF_PERIOD.
 */
class BacktestEngine {
public:
    /**
     * @brief Constructor
     * @param config Run configuration
     * @param adapter Strategy adapter driving entries and exits
     * @param quotes Quote source consulted once per bar
     * @param signals Entry signal source
     */
    BacktestEngine(BacktestConfig config, std::shared_ptr<BacktestingAdapter> adapter,
                   std::shared_ptr<QuoteProvider> quotes,
                   std::shared_ptr<SignalGenerator> signals);

    /**
     * @brief Run the simulation over bars
     *
     * @return Results, or CONFIGURATION_ERROR before the first bar, or
     *         UNRECOVERABLE_DATA when a bar is malformed or quotes cannot be
     *         fetched; the partial state then stays available from state()
     */
    Result<BacktestResults> run(const std::vector<Bar>& bars);

    const BacktestState& state() const {
        return state_;
    }

    /**
     * @brief Error that aborted the last run, or nullptr
     */
    const EngineError* fatal_error() const {
        return fatal_error_.get();
    }

    const BacktestConfig& config() const {
        return config_;
    }

private:
    Result<void> validate_config() const;
    Result<void> validate_bar(const Bar& bar, const Bar* previous) const;

    Result<void> process_bar(const Bar& bar, size_t index);
    std::vector<OptionContract> contracts_for_bar(const Bar& bar) const;
    void mark_and_exit(const Bar& bar, const std::vector<OptionQuote>& quotes);
    void consider_entry(const Bar& bar, size_t index, const std::vector<OptionQuote>& quotes);
    void close_position(const Position& position, const Timestamp& time, ExitReason reason);
    void close_all(const Bar& bar);
    void refresh_cash();
    double commission_for(const Position& position) const;
    void update_equity(const Timestamp& time);

    Result<BacktestResults> abort_run(ErrorCode code, const std::string& message);
    BacktestResults build_results() const;

    BacktestConfig config_;
    std::shared_ptr<BacktestingAdapter> adapter_;
    std::shared_ptr<QuoteProvider> quotes_;
    std::shared_ptr<SignalGenerator> signals_;
    BacktestMetricsCalculator calculator_;

    BacktestState state_;
    std::vector<Bar> history_;
    std::unique_ptr<EngineError> fatal_error_;
};

}  // namespace backtest
}  // namespace options_ngin
