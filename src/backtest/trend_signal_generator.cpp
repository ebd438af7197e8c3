// src/backtest/trend_signal_generator.cpp

#include "trend_lab/backtest/trend_signal_generator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace trend_lab {
namespace backtest {

int TrendSignals::enter_count() const {
    return static_cast<int>(std::count(signals.begin(), signals.end(), Signal::ENTER));
}

int TrendSignals::exit_count() const {
    return static_cast<int>(std::count(signals.begin(), signals.end(), Signal::EXIT));
}

TrendSignalGenerator::TrendSignalGenerator(MovingAverageType type) : type_(type) {}

std::vector<double> TrendSignalGenerator::simple_moving_average(
    const std::vector<double>& prices, int window) {
    std::vector<double> sma(prices.size(), std::numeric_limits<double>::quiet_NaN());
    if (window <= 0) {
        return sma;
    }

    const size_t w = static_cast<size_t>(window);
    for (size_t i = w - 1; i < prices.size(); ++i) {
        double sum = 0.0;
        for (size_t k = i + 1 - w; k <= i; ++k) {
            sum += prices[k];
        }
        sma[i] = sum / static_cast<double>(w);
    }
    return sma;
}

std::vector<double> TrendSignalGenerator::exponential_moving_average(
    const std::vector<double>& prices, int window) {
    std::vector<double> ema(prices.size(), 0.0);
    if (prices.empty() || window <= 0) {
        return ema;
    }
    double alpha = 2.0 / (window + 1);
    ema[0] = prices[0];

    for (size_t i = 1; i < prices.size(); ++i) {
        ema[i] = alpha * prices[i] + (1 - alpha) * ema[i - 1];
    }
    return ema;
}

Signal TrendSignalGenerator::detect_crossover(double prev_price, double prev_average,
                                              double price, double average) {
    if (price > average && prev_price <= prev_average) {
        return Signal::ENTER;
    }
    if (price < average && prev_price >= prev_average) {
        return Signal::EXIT;
    }
    return Signal::NONE;
}

Result<TrendSignals> TrendSignalGenerator::generate(const AlignedWindow& window,
                                                    int window_length) const {
    if (window_length < 1) {
        return make_error<TrendSignals>(ErrorCode::INVALID_ARGUMENT,
                                        "Window length must be positive",
                                        "TrendSignalGenerator");
    }
    if (window.signal_prices.size() != window.dates.size()) {
        return make_error<TrendSignals>(ErrorCode::INVALID_ARGUMENT,
                                        "Signal prices do not match window dates",
                                        "TrendSignalGenerator");
    }
    if (window.warmup_signal_prices.size() + 1 < static_cast<size_t>(window_length)) {
        return make_error<TrendSignals>(ErrorCode::INVALID_ARGUMENT,
                                        "Not enough warm-up rows for a " +
                                            std::to_string(window_length) + "-day average",
                                        "TrendSignalGenerator");
    }

    std::vector<double> history = window.warmup_signal_prices;
    history.insert(history.end(), window.signal_prices.begin(), window.signal_prices.end());

    std::vector<double> average = type_ == MovingAverageType::EMA
                                      ? exponential_moving_average(history, window_length)
                                      : simple_moving_average(history, window_length);

    const size_t offset = window.warmup_signal_prices.size();

    TrendSignals result;
    result.prices = window.signal_prices;
    result.moving_average.assign(average.begin() + static_cast<std::ptrdiff_t>(offset),
                                 average.end());
    result.signals.assign(window.size(), Signal::NONE);

    for (size_t t = 1; t < window.size(); ++t) {
        result.signals[t] =
            detect_crossover(result.prices[t - 1], result.moving_average[t - 1],
                             result.prices[t], result.moving_average[t]);
    }

    return result;
}

}  // namespace backtest
}  // namespace trend_lab
