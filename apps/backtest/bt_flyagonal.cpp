// apps/backtest/bt_flyagonal.cpp
// Flyagonal backtest over CSV or generated SPX bars with model-priced quotes.
// Usage: bt_flyagonal [config.json]

#include <iostream>
#include <memory>
#include "bt_common.hpp"
#include "options_ngin/strategy/flyagonal_adapter.hpp"
#include "options_ngin/strategy/regime_classifier.hpp"

using namespace options_ngin;
using namespace options_ngin::backtest;

int main(int argc, char* argv[]) {
    try {
        auto app_config_result = apps::load_app_config(argc, argv);
        if (app_config_result.is_error()) {
            std::cerr << app_config_result.error()->to_string() << std::endl;
            return 1;
        }
        const nlohmann::json& app_config = app_config_result.value();

        if (!apps::initialize_logger(app_config, "bt_flyagonal")) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_flyagonal");
        INFO("Logger initialized successfully");

        BacktestConfig config;
        config.symbol = "SPX";
        config.periods_per_year = 252.0 * 13.0;  // 30 minute bars
        config.output_directory = "results/flyagonal";
        config.from_json(apps::section(app_config, "backtest"));

        FlyagonalConfig adapter_config;
        adapter_config.underlying_symbol = config.symbol;
        adapter_config.min_confidence = 60.0;
        adapter_config.from_json(apps::section(app_config, "adapter"));

        nlohmann::json signal_config = apps::section(app_config, "signals");
        size_t vol_lookback = signal_config.value("volatility_lookback", size_t{20});
        double confidence = signal_config.value("confidence", 70.0);
        int contracts = signal_config.value("contracts", 1);

        std::cout << "=== Backtest Configuration ===" << std::endl;
        std::cout << config.to_json().dump(2) << std::endl;
        std::cout << adapter_config.to_json().dump(2) << std::endl;

        auto bars_result = apps::load_bars(app_config, config.symbol);
        if (bars_result.is_error()) {
            std::cerr << "Failed to load bars: " << bars_result.error()->to_string() << std::endl;
            return 1;
        }
        const auto& bars = bars_result.value();
        INFO("Loaded " << bars.size() << " bars");

        auto adapter = std::make_shared<FlyagonalAdapter>(adapter_config);
        auto quotes = std::make_shared<SyntheticQuoteProvider>(apps::quote_config(app_config));

        double periods_per_year = config.periods_per_year;
        auto signals = std::make_shared<CallbackSignalGenerator>(
            [adapter, vol_lookback, periods_per_year, confidence, contracts](
                const std::vector<Bar>& history,
                const std::vector<OptionQuote>&) -> std::optional<Signal> {
                auto vol_index = apps::realized_vol_index(history, vol_lookback, periods_per_year);
                if (!vol_index) {
                    return std::nullopt;
                }
                const Bar& bar = history.back();
                FlyagonalLayout layout = adapter->layout(bar.close, bar.timestamp);

                Signal signal;
                signal.action = SignalAction::ENTER;
                signal.confidence = confidence;
                signal.target_contracts = contracts;
                signal.timestamp = bar.timestamp;
                signal.indicators.volatility_index = vol_index;
                signal.indicators.profit_zone_width = layout.upper_call - layout.long_put;
                signal.indicators.reason =
                    "realized vol " + regime_to_string(classify_regime(vol_index));
                return signal;
            });

        BacktestEngine engine(config, adapter, quotes, signals);
        return apps::run_and_report(engine, bars);

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
