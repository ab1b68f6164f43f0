// apps/backtest/bt_single_leg.cpp
// Directional single-leg backtest: buys a call after an up move, a put after a down move.
// Usage: bt_single_leg [config.json]

#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include "bt_common.hpp"
#include "options_ngin/strategy/single_leg_adapter.hpp"

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

        if (!apps::initialize_logger(app_config, "bt_single_leg")) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("bt_single_leg");
        INFO("Logger initialized successfully");

        BacktestConfig config;
        config.symbol = "SPX";
        config.periods_per_year = 252.0 * 13.0;
        config.min_bars_between_entries = 4;
        config.output_directory = "results/single_leg";
        config.from_json(apps::section(app_config, "backtest"));

        SingleLegConfig adapter_config;
        adapter_config.underlying_symbol = config.symbol;
        adapter_config.min_confidence = 50.0;
        adapter_config.from_json(apps::section(app_config, "adapter"));

        nlohmann::json signal_config = apps::section(app_config, "signals");
        size_t momentum_bars = signal_config.value("momentum_bars", size_t{6});
        double min_move_percent = signal_config.value("min_move_percent", 0.25);
        size_t vol_lookback = signal_config.value("volatility_lookback", size_t{20});

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

        auto adapter = std::make_shared<SingleLegAdapter>(adapter_config);
        auto quotes = std::make_shared<SyntheticQuoteProvider>(apps::quote_config(app_config));

        double periods_per_year = config.periods_per_year;
        auto signals = std::make_shared<CallbackSignalGenerator>(
            [momentum_bars, min_move_percent, vol_lookback, periods_per_year](
                const std::vector<Bar>& history,
                const std::vector<OptionQuote>&) -> std::optional<Signal> {
                if (history.size() <= momentum_bars) {
                    return std::nullopt;
                }
                const Bar& bar = history.back();
                double reference = history[history.size() - 1 - momentum_bars].close;
                double move_percent = (bar.close - reference) / reference * 100.0;
                if (std::fabs(move_percent) < min_move_percent) {
                    return std::nullopt;
                }

                Signal signal;
                signal.action = SignalAction::ENTER;
                signal.direction = move_percent > 0.0 ? OptionType::CALL : OptionType::PUT;
                // Scale confidence with the size of the move, capped at 100
                signal.confidence = std::min(100.0, 50.0 + 50.0 * std::fabs(move_percent));
                signal.timestamp = bar.timestamp;
                signal.indicators.volatility_index =
                    apps::realized_vol_index(history, vol_lookback, periods_per_year);
                signal.indicators.reason = "momentum " + std::to_string(move_percent) + "%";
                return signal;
            });

        BacktestEngine engine(config, adapter, quotes, signals);
        return apps::run_and_report(engine, bars);

    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}
