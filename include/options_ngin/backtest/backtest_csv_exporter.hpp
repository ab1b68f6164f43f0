// include/options_ngin/backtest/backtest_csv_exporter.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "options_ngin/backtest/backtest_engine.hpp"
#include "options_ngin/core/error.hpp"
#include "options_ngin/strategy/types.hpp"

namespace options_ngin {
namespace backtest {

/**
 * @brief Writes the trade ledger, equity curve and run summary to disk
 *
 * Files: trades.csv (one line per trade), equity_curve.csv and
 * summary.json, all under the output directory.
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(const std::string& output_directory);
    ~BacktestCSVExporter();

    /**
     * @brief Create the output directory and open the CSV files with headers
     */
    Result<void> initialize_files();

    Result<void> append_trade(const Trade& trade);

    Result<void> append_equity_point(const Timestamp& time, double equity);

    /**
     * @brief Write summary.json
     */
    Result<void> write_summary(const BacktestResults& results) const;

    /**
     * @brief initialize_files, every trade and equity point, then the summary
     */
    Result<void> export_results(const BacktestResults& results);

    /**
     * @brief Header line of trades.csv
     */
    static std::string trade_header();

    /**
     * @brief One trades.csv line, without the newline
     */
    static std::string format_trade(const Trade& trade);

    static nlohmann::json summary_to_json(const BacktestResults& results);

    void finalize();

private:
    std::string output_directory_;
    std::ofstream trades_file_;
    std::ofstream equity_file_;
};

}  // namespace backtest
}  // namespace options_ngin
