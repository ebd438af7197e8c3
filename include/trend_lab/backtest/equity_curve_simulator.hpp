// include/trend_lab/backtest/equity_curve_simulator.hpp
#pragma once

#include <string>
#include <vector>
#include "trend_lab/backtest/position_tracker.hpp"
#include "trend_lab/backtest/price_aligner.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {
namespace backtest {

/**
 * @brief Cumulative growth multiplier, 1.0 on the first analysis date
 */
struct EquityCurve {
    std::string name;
    std::vector<Timestamp> dates;
    std::vector<double> values;
    std::vector<double> returns;  // One-day percentage change, 0 on the first date

    size_t size() const {
        return values.size();
    }
    bool empty() const {
        return values.empty();
    }
    double final_value() const {
        return values.empty() ? 1.0 : values.back();
    }
};

/**
 * @brief The three curves produced per run, on a shared date index
 */
struct EquityCurves {
    EquityCurve strategy;   // Position-gated traded-instrument returns
    EquityCurve bh_traded;  // Buy and hold of the traded instrument
    EquityCurve bh_signal;  // Buy and hold of the signal instrument
};

class EquityCurveSimulator {
public:
    EquityCurveSimulator() = default;

    /**
     * @brief Compound the three curves over the analysis window
     *
     * The strategy earns day t's traded return only when it was invested on
     * both t-1 and t; entry and exit days are flat.
     *
     * @return INVALID_ARGUMENT if positions and window differ in length
     */
    Result<EquityCurves> simulate(const AlignedWindow& window,
                                  const PositionSeries& positions) const;

    /**
     * @brief Unconditional compounding of a price series from 1.0
     */
    EquityCurve buy_and_hold(const std::string& name, const std::vector<Timestamp>& dates,
                             const std::vector<Price>& prices) const;

    /**
     * @brief One-day percentage change of a curve, 0 on the first date
     */
    static std::vector<double> percentage_change(const std::vector<double>& values);
};

}  // namespace backtest
}  // namespace trend_lab
