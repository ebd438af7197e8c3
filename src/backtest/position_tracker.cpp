// src/backtest/position_tracker.cpp

#include "trend_lab/backtest/position_tracker.hpp"

namespace trend_lab {
namespace backtest {

int PositionSeries::transition_count() const {
    int count = 0;
    for (size_t i = 1; i < states.size(); ++i) {
        if (states[i] != states[i - 1]) {
            ++count;
        }
    }
    return count;
}

int PositionSeries::invested_days() const {
    int count = 0;
    for (auto state : states) {
        if (state == PositionState::INVESTED) {
            ++count;
        }
    }
    return count;
}

PositionTracker::PositionTracker(InitialPolicy policy) : policy_(policy) {}

PositionState PositionTracker::initial_state(double first_price, double first_average) const {
    switch (policy_) {
        case InitialPolicy::START_INVESTED:
            return PositionState::INVESTED;
        case InitialPolicy::START_INVESTED_IF_ABOVE:
            return first_price > first_average ? PositionState::INVESTED : PositionState::FLAT;
        case InitialPolicy::START_FLAT:
        default:
            return PositionState::FLAT;
    }
}

Result<PositionSeries> PositionTracker::track(const TrendSignals& signals) const {
    if (signals.prices.size() != signals.size() ||
        signals.moving_average.size() != signals.size()) {
        return make_error<PositionSeries>(ErrorCode::INVALID_ARGUMENT,
                                          "Signal stream is inconsistent with its prices",
                                          "PositionTracker");
    }

    PositionSeries positions;
    positions.policy = policy_;
    if (signals.size() == 0) {
        return positions;
    }

    positions.states.reserve(signals.size());
    PositionState current = initial_state(signals.prices[0], signals.moving_average[0]);

    for (size_t t = 0; t < signals.size(); ++t) {
        // The first date carries no signal; its state is the policy's alone
        if (t > 0) {
            if (signals.signals[t] == Signal::ENTER) {
                current = PositionState::INVESTED;
            } else if (signals.signals[t] == Signal::EXIT) {
                current = PositionState::FLAT;
            }
        }
        positions.states.push_back(current);
    }

    return positions;
}

}  // namespace backtest
}  // namespace trend_lab
