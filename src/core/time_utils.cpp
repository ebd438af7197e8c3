// src/core/time_utils.cpp

#include "trend_lab/core/time_utils.hpp"
#include <algorithm>
#include <cstdio>
#include <sstream>

namespace trend_lab {
namespace core {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    const unsigned d = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
    const unsigned m = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
    const int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return CivilDate{static_cast<int>(y), m, d};
}

Timestamp from_days(int64_t days) {
    return Timestamp(std::chrono::seconds(days * SECONDS_PER_DAY));
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

}  // namespace

Timestamp make_date(int year, unsigned month, unsigned day) {
    return from_days(days_from_civil(year, month, day));
}

int64_t days_since_epoch(const Timestamp& ts) {
    int64_t secs =
        std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    int64_t days = secs / SECONDS_PER_DAY;
    if (secs % SECONDS_PER_DAY < 0) {
        --days;
    }
    return days;
}

CivilDate to_civil(const Timestamp& ts) {
    return civil_from_days(days_since_epoch(ts));
}

Timestamp floor_to_day(const Timestamp& ts) {
    return from_days(days_since_epoch(ts));
}

int64_t days_between(const Timestamp& from, const Timestamp& to) {
    return days_since_epoch(to) - days_since_epoch(from);
}

Timestamp add_days(const Timestamp& ts, int64_t days) {
    return from_days(days_since_epoch(ts) + days);
}

unsigned days_in_month(int year, unsigned month) {
    static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return lengths[(month - 1) % 12];
}

Timestamp last_day_of_previous_month(const Timestamp& ts) {
    CivilDate date = to_civil(ts);
    // Day before the first of the current month
    return from_days(days_from_civil(date.year, date.month, 1) - 1);
}

Timestamp subtract_months(const Timestamp& ts, int months) {
    CivilDate date = to_civil(ts);
    int64_t month_index = static_cast<int64_t>(date.year) * 12 + (date.month - 1) - months;
    int64_t year = month_index >= 0 ? month_index / 12 : (month_index - 11) / 12;
    unsigned month = static_cast<unsigned>(month_index - year * 12) + 1;
    unsigned day = std::min(date.day, days_in_month(static_cast<int>(year), month));
    return make_date(static_cast<int>(year), month, day);
}

Result<Timestamp> parse_date(const std::string& str) {
    if (str.size() < 10 || (str.size() > 10 && str[10] != 'T' && str[10] != ' ')) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Invalid date format (expected YYYY-MM-DD): " + str,
                                     "TimeUtils");
    }

    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    char dash1 = 0;
    char dash2 = 0;
    std::istringstream ss(str.substr(0, 10));
    ss >> year >> dash1 >> month >> dash2 >> day;
    if (ss.fail() || dash1 != '-' || dash2 != '-' || month < 1 || month > 12 || day < 1 ||
        day > days_in_month(year, month)) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR, "Invalid date: " + str,
                                     "TimeUtils");
    }

    return make_date(year, month, day);
}

std::string format_date(const Timestamp& ts) {
    CivilDate date = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year, date.month, date.day);
    return std::string(buffer);
}

std::string format_month(const Timestamp& ts) {
    CivilDate date = to_civil(ts);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u", date.year, date.month);
    return std::string(buffer);
}

Timestamp today() {
    return floor_to_day(std::chrono::system_clock::now());
}

}  // namespace core
}  // namespace trend_lab
