// include/trend_lab/backtest/backtest_config.hpp

#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "trend_lab/core/config_base.hpp"
#include "trend_lab/core/error.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {
namespace backtest {

/**
 * @brief Parameters of one trend-filter backtest
 *
 * Dates serialize as "YYYY-MM-DD", enums by name.
 */
struct BacktestConfig : public ConfigBase {
    // Instruments
    std::string signal_symbol;  // Drives the moving-average filter
    std::string traded_symbol;  // Held while the filter is on

    // Analysis range, both ends inclusive
    Timestamp start_date;
    Timestamp end_date;

    // Filter parameters
    int window_length{200};
    InitialPolicy initial_policy{InitialPolicy::START_FLAT};
    MovingAverageType moving_average_type{MovingAverageType::SMA};

    double initial_capital{10000.0};
    int min_buffer_days{365};

    /**
     * @return INVALID_RANGE if start_date >= end_date,
     *         INVALID_ARGUMENT for an empty symbol or a non-positive
     *         window length or initial capital
     */
    Result<void> validate() const;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace backtest
}  // namespace trend_lab
