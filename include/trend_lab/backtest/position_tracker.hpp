// include/trend_lab/backtest/position_tracker.hpp
#pragma once

#include <vector>
#include "trend_lab/backtest/trend_signal_generator.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {
namespace backtest {

/**
 * @brief Day-by-day exposure derived from a signal stream
 */
struct PositionSeries {
    InitialPolicy policy{InitialPolicy::START_FLAT};
    std::vector<PositionState> states;

    size_t size() const {
        return states.size();
    }
    bool is_invested(size_t index) const {
        return states[index] == PositionState::INVESTED;
    }

    /**
     * @brief Number of dates on which the state differs from the previous date
     */
    int transition_count() const;

    /**
     * @brief Number of dates spent invested
     */
    int invested_days() const;
};

/**
 * @brief Two-state machine: ENTER -> INVESTED, EXIT -> FLAT, NONE keeps the state
 */
class PositionTracker {
public:
    explicit PositionTracker(InitialPolicy policy = InitialPolicy::START_FLAT);

    /**
     * @return INVALID_ARGUMENT if prices, averages and signals differ in length
     */
    Result<PositionSeries> track(const TrendSignals& signals) const;

    /**
     * @brief State on the first analysis date under this tracker's policy
     */
    PositionState initial_state(double first_price, double first_average) const;

    InitialPolicy policy() const {
        return policy_;
    }

private:
    InitialPolicy policy_;
};

}  // namespace backtest
}  // namespace trend_lab
