// include/trend_lab/backtest/trend_signal_generator.hpp
#pragma once

#include <vector>
#include "trend_lab/backtest/price_aligner.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {
namespace backtest {

/**
 * @brief Moving average and crossover events on the analysis dates
 */
struct TrendSignals {
    std::vector<Price> prices;          // Signal-instrument prices
    std::vector<double> moving_average;
    std::vector<Signal> signals;        // signals[0] is always NONE

    size_t size() const {
        return signals.size();
    }
    int enter_count() const;
    int exit_count() const;
};

/**
 * @brief Pure calculator turning an aligned window into crossover signals
 *
 * ENTER when the price closes above its average after closing at or below it
 * the day before, EXIT on the mirror move. Exact equality never fires. The
 * first analysis date never emits a signal.
 */
class TrendSignalGenerator {
public:
    explicit TrendSignalGenerator(MovingAverageType type = MovingAverageType::SMA);

    /**
     * @param window Aligned window holding at least window_length - 1 warm-up rows
     * @param window_length Moving-average length in trading days
     * @return INVALID_ARGUMENT if the window cannot support the average
     */
    Result<TrendSignals> generate(const AlignedWindow& window, int window_length) const;

    /**
     * @brief Trailing simple moving average, NaN until `window` observations exist
     */
    static std::vector<double> simple_moving_average(const std::vector<double>& prices,
                                                     int window);

    /**
     * @brief Exponential moving average, alpha = 2 / (window + 1), seeded with prices[0]
     */
    static std::vector<double> exponential_moving_average(const std::vector<double>& prices,
                                                          int window);

    /**
     * @brief Crossover rule for two consecutive observations
     */
    static Signal detect_crossover(double prev_price, double prev_average, double price,
                                   double average);

private:
    MovingAverageType type_;
};

}  // namespace backtest
}  // namespace trend_lab
