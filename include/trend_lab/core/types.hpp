// include/trend_lab/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "trend_lab/core/error.hpp"

namespace trend_lab {

/**
 * @brief Timestamp type for consistent time representation
 * Daily observations are stamped at midnight UTC
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Single dated observation of an instrument
 */
struct PricePoint {
    Timestamp timestamp;
    Price price{0.0};

    PricePoint() = default;
    PricePoint(Timestamp ts, Price p) : timestamp(ts), price(p) {}
};

/**
 * @brief Date-ascending price history of one instrument
 * Dates are strictly increasing, no duplicates
 */
struct PriceSeries {
    std::string symbol;
    std::vector<PricePoint> points;

    PriceSeries() = default;
    PriceSeries(std::string sym, std::vector<PricePoint> pts)
        : symbol(std::move(sym)), points(std::move(pts)) {}

    bool empty() const {
        return points.empty();
    }
    size_t size() const {
        return points.size();
    }
};

/**
 * @brief Crossover event emitted for a single date
 */
enum class Signal {
    NONE,
    ENTER,  // Price crossed above its moving average
    EXIT    // Price crossed below its moving average
};

/**
 * @brief Exposure to the traded instrument on a given date
 */
enum class PositionState {
    FLAT,
    INVESTED
};

/**
 * @brief Position taken on the first date of the analysis window
 */
enum class InitialPolicy {
    START_FLAT,
    START_INVESTED,
    START_INVESTED_IF_ABOVE  // Invested iff price[0] > average[0]
};

/**
 * @brief Moving average flavour used for the trend filter
 */
enum class MovingAverageType {
    SMA,
    EMA
};

std::string signal_to_string(Signal signal);
std::string position_state_to_string(PositionState state);
std::string initial_policy_to_string(InitialPolicy policy);
std::string moving_average_type_to_string(MovingAverageType type);

Result<InitialPolicy> initial_policy_from_string(const std::string& str);
Result<MovingAverageType> moving_average_type_from_string(const std::string& str);

}  // namespace trend_lab
