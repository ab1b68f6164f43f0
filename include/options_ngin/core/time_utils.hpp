// include/options_ngin/core/time_utils.hpp
#pragma once

#include <time.h>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string>
#include "options_ngin/core/types.hpp"

namespace options_ngin {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Inverse of safe_gmtime: broken-down UTC time to time_t
 */
inline std::time_t safe_timegm(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

/**
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result;

    if (use_local_time) {
        safe_localtime(&now_c, &result);
    } else {
        safe_gmtime(&now_c, &result);
    }

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a timestamp as UTC "YYYY-MM-DD HH:MM:SS"
 */
inline std::string format_timestamp(const Timestamp& ts) {
    auto tt = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    if (!safe_gmtime(&tt, &result)) {
        return "";
    }
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &result);
    return std::string(buffer);
}

/**
 * @brief Parse a UTC timestamp
 *
 * Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM" and "YYYY-MM-DD HH:MM:SS", with
 * either a space or 'T' separator and an optional trailing 'Z'.
 *
 * @return The timestamp, or std::nullopt if the text is not a valid date
 */
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = ' ';
    int date_end = -1, minute_end = -1, second_end = -1;

    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d%n%c%2d:%2d%n:%2d%n", &year, &month, &day,
                             &date_end, &sep, &hour, &minute, &minute_end, &second, &second_end);
    if (fields < 3) {
        return std::nullopt;
    }
    if (fields > 3 && sep != ' ' && sep != 'T') {
        return std::nullopt;
    }
    if (fields == 4 || fields == 5) {
        return std::nullopt;
    }

    // Only an optional 'Z' may follow the last field
    int end = fields == 3 ? date_end : (fields == 6 ? minute_end : second_end);
    if (end < 0) {
        return std::nullopt;
    }
    std::string rest = text.substr(static_cast<size_t>(end));
    if (!rest.empty() && rest != "Z") {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour < 0 || hour > 23 || minute < 0 ||
        minute > 59 || second < 0 || second > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;

    std::time_t tt = safe_timegm(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

}  // namespace core
}  // namespace options_ngin
