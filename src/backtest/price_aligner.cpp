// src/backtest/price_aligner.cpp

#include "trend_lab/backtest/price_aligner.hpp"
#include <algorithm>
#include "trend_lab/core/logger.hpp"
#include "trend_lab/core/time_utils.hpp"

namespace trend_lab {
namespace backtest {

namespace {

struct JoinedRow {
    int64_t day;
    Timestamp timestamp;
    Price signal_price;
    Price traded_price;
};

// Both inputs are date-ascending; rows are matched on their calendar day
std::vector<JoinedRow> inner_join(const PriceSeries& signal, const PriceSeries& traded) {
    std::vector<JoinedRow> rows;
    rows.reserve(std::min(signal.size(), traded.size()));

    size_t i = 0;
    size_t j = 0;
    while (i < signal.points.size() && j < traded.points.size()) {
        int64_t signal_day = core::days_since_epoch(signal.points[i].timestamp);
        int64_t traded_day = core::days_since_epoch(traded.points[j].timestamp);
        if (signal_day < traded_day) {
            ++i;
        } else if (traded_day < signal_day) {
            ++j;
        } else {
            rows.push_back({signal_day, core::floor_to_day(signal.points[i].timestamp),
                            signal.points[i].price, traded.points[j].price});
            ++i;
            ++j;
        }
    }
    return rows;
}

}  // namespace

PriceAligner::PriceAligner(int min_buffer_days) : min_buffer_days_(min_buffer_days) {}

int PriceAligner::buffer_days(int window_length) const {
    // Five trading days per calendar week plus a month of holiday slack
    int needed = (window_length * 7 + 4) / 5 + 30;
    return std::max(min_buffer_days_, needed);
}

Result<AlignedWindow> PriceAligner::align(const PriceSeries& signal, const PriceSeries& traded,
                                          const Timestamp& start, const Timestamp& end,
                                          int window_length) const {
    if (start >= end) {
        return make_error<AlignedWindow>(ErrorCode::INVALID_RANGE,
                                         "Start date " + core::format_date(start) +
                                             " must be earlier than end date " +
                                             core::format_date(end),
                                         "PriceAligner");
    }

    if (window_length < 1) {
        return make_error<AlignedWindow>(ErrorCode::INVALID_ARGUMENT,
                                         "Window length must be positive, got " +
                                             std::to_string(window_length),
                                         "PriceAligner");
    }

    std::vector<JoinedRow> joined = inner_join(signal, traded);
    if (joined.empty()) {
        return make_error<AlignedWindow>(ErrorCode::NO_OVERLAP,
                                         signal.symbol + " and " + traded.symbol +
                                             " share no common dates",
                                         "PriceAligner");
    }

    const int64_t start_day = core::days_since_epoch(start);
    const int64_t end_day = core::days_since_epoch(end);
    const int64_t buffered_start_day = start_day - buffer_days(window_length);

    AlignedWindow window;
    window.signal_symbol = signal.symbol;
    window.traded_symbol = traded.symbol;
    window.window_length = window_length;

    // All joined rows before start count towards the history requirement
    auto first_analysis = std::lower_bound(
        joined.begin(), joined.end(), start_day,
        [](const JoinedRow& row, int64_t day) { return row.day < day; });
    const size_t pre_start_rows = static_cast<size_t>(first_analysis - joined.begin());

    // Warm-up: the calendar buffer, widened to the last window_length rows if it holds fewer
    auto warmup_begin = std::lower_bound(
        joined.begin(), first_analysis, buffered_start_day,
        [](const JoinedRow& row, int64_t day) { return row.day < day; });
    if (pre_start_rows >= static_cast<size_t>(window_length) &&
        first_analysis - warmup_begin < window_length) {
        warmup_begin = first_analysis - window_length;
    }

    for (auto it = warmup_begin; it != first_analysis; ++it) {
        window.warmup_signal_prices.push_back(it->signal_price);
    }
    for (auto it = first_analysis; it != joined.end() && it->day <= end_day; ++it) {
        window.dates.push_back(it->timestamp);
        window.signal_prices.push_back(it->signal_price);
        window.traded_prices.push_back(it->traded_price);
    }

    DEBUG("Aligned " << signal.symbol << "/" << traded.symbol << ": "
                     << window.warmup_signal_prices.size() << " warm-up rows, "
                     << window.dates.size() << " analysis rows");

    if (pre_start_rows < static_cast<size_t>(window_length)) {
        return make_error<AlignedWindow>(
            ErrorCode::INSUFFICIENT_HISTORY,
            "Only " + std::to_string(pre_start_rows) +
                " aligned rows before " + core::format_date(start) + ", " +
                std::to_string(window_length) + " required",
            "PriceAligner");
    }

    if (window.empty()) {
        return make_error<AlignedWindow>(ErrorCode::NO_OVERLAP,
                                         "No aligned rows between " + core::format_date(start) +
                                             " and " + core::format_date(end),
                                         "PriceAligner");
    }

    return window;
}

}  // namespace backtest
}  // namespace trend_lab
