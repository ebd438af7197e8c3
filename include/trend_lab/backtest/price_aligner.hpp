// include/trend_lab/backtest/price_aligner.hpp
#pragma once

#include <string>
#include <vector>
#include "trend_lab/core/error.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {
namespace backtest {

/**
 * @brief Signal and traded prices on their common dates inside the requested range
 *
 * Every analysis date carries a signal price and a traded price. The aligned
 * signal prices that precede the first analysis date are kept in
 * `warmup_signal_prices` so a moving average is defined on every analysis date.
 */
struct AlignedWindow {
    std::string signal_symbol;
    std::string traded_symbol;
    int window_length{0};

    std::vector<Timestamp> dates;
    std::vector<Price> signal_prices;
    std::vector<Price> traded_prices;
    std::vector<Price> warmup_signal_prices;  // Oldest first

    size_t size() const {
        return dates.size();
    }
    bool empty() const {
        return dates.empty();
    }
};

/**
 * @brief Inner-joins two price series and cuts the analysis window
 *
 * The requested start is extended backwards by a calendar-day buffer so the
 * moving average can warm up. When the buffer holds fewer than window_length
 * aligned rows, the warm-up is widened to the last window_length rows before
 * start. Fails with:
 * - INVALID_RANGE if start >= end
 * - INVALID_ARGUMENT if window_length < 1
 * - NO_OVERLAP if the series share no date (or none inside [start, end])
 * - INSUFFICIENT_HISTORY if fewer than window_length aligned rows precede start
 */
class PriceAligner {
public:
    explicit PriceAligner(int min_buffer_days = 365);

    Result<AlignedWindow> align(const PriceSeries& signal, const PriceSeries& traded,
                                const Timestamp& start, const Timestamp& end,
                                int window_length) const;

    /**
     * @brief Calendar days of warm-up kept before start: at least min_buffer_days,
     * and about window_length weekdays plus a month
     */
    int buffer_days(int window_length) const;

private:
    int min_buffer_days_;
};

}  // namespace backtest
}  // namespace trend_lab
