// src/backtest/equity_curve_simulator.cpp

#include "trend_lab/backtest/equity_curve_simulator.hpp"

namespace trend_lab {
namespace backtest {

std::vector<double> EquityCurveSimulator::percentage_change(const std::vector<double>& values) {
    std::vector<double> changes(values.size(), 0.0);
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i - 1] != 0.0) {
            changes[i] = values[i] / values[i - 1] - 1.0;
        }
    }
    return changes;
}

EquityCurve EquityCurveSimulator::buy_and_hold(const std::string& name,
                                               const std::vector<Timestamp>& dates,
                                               const std::vector<Price>& prices) const {
    EquityCurve curve;
    curve.name = name;
    curve.dates = dates;
    curve.values.reserve(prices.size());
    curve.returns.assign(prices.size(), 0.0);

    double equity = 1.0;
    for (size_t t = 0; t < prices.size(); ++t) {
        if (t > 0) {
            double r = prices[t] / prices[t - 1] - 1.0;
            curve.returns[t] = r;
            equity *= (1.0 + r);
        }
        curve.values.push_back(equity);
    }
    return curve;
}

Result<EquityCurves> EquityCurveSimulator::simulate(const AlignedWindow& window,
                                                    const PositionSeries& positions) const {
    if (positions.size() != window.size() || window.traded_prices.size() != window.size() ||
        window.signal_prices.size() != window.size()) {
        return make_error<EquityCurves>(ErrorCode::INVALID_ARGUMENT,
                                        "Position stream length " +
                                            std::to_string(positions.size()) +
                                            " does not match window length " +
                                            std::to_string(window.size()),
                                        "EquityCurveSimulator");
    }

    EquityCurves curves;

    curves.strategy.name = "strategy";
    curves.strategy.dates = window.dates;
    curves.strategy.values.reserve(window.size());

    double equity = 1.0;
    for (size_t t = 0; t < window.size(); ++t) {
        if (t > 0 && positions.is_invested(t) && positions.is_invested(t - 1)) {
            double r = window.traded_prices[t] / window.traded_prices[t - 1] - 1.0;
            equity *= (1.0 + r);
        }
        curves.strategy.values.push_back(equity);
    }
    curves.strategy.returns = percentage_change(curves.strategy.values);

    curves.bh_traded = buy_and_hold("bh_traded", window.dates, window.traded_prices);
    curves.bh_signal = buy_and_hold("bh_signal", window.dates, window.signal_prices);

    return curves;
}

}  // namespace backtest
}  // namespace trend_lab
