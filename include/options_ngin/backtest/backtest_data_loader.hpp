// include/options_ngin/backtest/backtest_data_loader.hpp
#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"
#include "options_ngin/instruments/option.hpp"

namespace options_ngin {
namespace backtest {

/**
 * @brief Parameters for a generated underlying price path
 */
struct SyntheticPathConfig {
    std::string symbol{"SPX"};
    Timestamp start;
    size_t bars{390};
    int interval_minutes{30};
    double start_price{6000.0};
    double annual_drift{0.05};
    double annual_volatility{0.15};
    uint64_t seed{7};
};

/**
 * @brief Loads bars and option quotes for a backtest
 *
 * CSV files carry a header row. Timestamps are UTC, "YYYY-MM-DD HH:MM:SS"
 * or with a 'T' separator. Any malformed row fails the whole load with
 * INVALID_DATA naming the line.
 */
class BacktestDataLoader {
public:
    BacktestDataLoader();

    /**
     * @brief Read timestamp,open,high,low,close,volume rows
     */
    Result<std::vector<Bar>> load_bars_csv(const std::string& path,
                                           const std::string& symbol) const;

    /**
     * @brief Read timestamp,type,strike,expiration,bid,ask,last,volume,
     *        open_interest,implied_volatility rows
     * @return Quotes paired with the timestamp they were observed at
     */
    Result<std::vector<std::pair<Timestamp, OptionQuote>>> load_quotes_csv(
        const std::string& path) const;

    /**
     * @brief Geometric Brownian motion path; identical config gives identical bars
     */
    std::vector<Bar> generate_synthetic_bars(const SyntheticPathConfig& config) const;

private:
    static std::vector<std::string> split_csv_line(const std::string& line);
    static bool parse_double(const std::string& text, double& out);
};

}  // namespace backtest
}  // namespace options_ngin
