// include/options_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace options_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Underlying market data bar
 * Represents OHLCV data for any timeframe
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

constexpr double MINUTES_PER_DAY = 1440.0;
constexpr double DAYS_PER_YEAR = 365.0;

/**
 * @brief Elapsed minutes from start to end (negative if end precedes start)
 */
inline double minutes_between(const Timestamp& start, const Timestamp& end) {
    return std::chrono::duration<double, std::ratio<60>>(end - start).count();
}

/**
 * @brief Year fraction between two timestamps on a 365-day calendar, never negative
 */
inline double years_between(const Timestamp& start, const Timestamp& end) {
    double minutes = minutes_between(start, end);
    return minutes > 0.0 ? minutes / (MINUTES_PER_DAY * DAYS_PER_YEAR) : 0.0;
}

}  // namespace options_ngin
