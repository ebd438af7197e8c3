// include/trend_lab/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <cstdint>
#include <string>
#include "trend_lab/core/error.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {
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
 *
 * @param time Pointer to time_t value
 * @param result Pointer to tm struct where result will be stored
 * @return Pointer to the result tm struct on success, nullptr on failure
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
 * @brief Get current time as a string with specified format
 *
 * @param format Format string compatible with strftime
 * @param use_local_time If true, uses local time, otherwise GMT
 * @return Formatted time string
 */
inline std::string get_formatted_time(const char* format, bool use_local_time = true) {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
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

// ========== Calendar Dates ==========
// Daily timestamps are midnight UTC. All helpers below work on the proleptic
// Gregorian calendar and ignore the time-of-day part of their inputs.

struct CivilDate {
    int year;
    unsigned month;  // 1-12
    unsigned day;    // 1-31
};

/**
 * @brief Build a midnight-UTC timestamp from a calendar date
 */
Timestamp make_date(int year, unsigned month, unsigned day);

/**
 * @brief Split a timestamp into its UTC calendar date
 */
CivilDate to_civil(const Timestamp& ts);

/**
 * @brief Whole days since 1970-01-01 (floored)
 */
int64_t days_since_epoch(const Timestamp& ts);

/**
 * @brief Truncate a timestamp to midnight UTC of the same day
 */
Timestamp floor_to_day(const Timestamp& ts);

/**
 * @brief Calendar days from `from` to `to` (negative if `to` is earlier)
 */
int64_t days_between(const Timestamp& from, const Timestamp& to);

Timestamp add_days(const Timestamp& ts, int64_t days);

unsigned days_in_month(int year, unsigned month);

/**
 * @brief Last calendar day of the month preceding the month of `ts`
 */
Timestamp last_day_of_previous_month(const Timestamp& ts);

/**
 * @brief Move back a number of calendar months, clamping the day to the
 * length of the target month (2024-02-29 minus 12 months is 2023-02-28)
 */
Timestamp subtract_months(const Timestamp& ts, int months);

/**
 * @brief Parse "YYYY-MM-DD"; a trailing time part ("T..." or " ...") is ignored
 */
Result<Timestamp> parse_date(const std::string& str);

/**
 * @brief Format as "YYYY-MM-DD"
 */
std::string format_date(const Timestamp& ts);

/**
 * @brief Format as "YYYY-MM"
 */
std::string format_month(const Timestamp& ts);

/**
 * @brief Today's date, midnight UTC
 */
Timestamp today();

}  // namespace core
}  // namespace trend_lab
