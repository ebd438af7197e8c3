// src/core/types.cpp

#include "trend_lab/core/types.hpp"

namespace trend_lab {

std::string signal_to_string(Signal signal) {
    switch (signal) {
        case Signal::ENTER:
            return "ENTER";
        case Signal::EXIT:
            return "EXIT";
        case Signal::NONE:
        default:
            return "NONE";
    }
}

std::string position_state_to_string(PositionState state) {
    return state == PositionState::INVESTED ? "INVESTED" : "FLAT";
}

std::string initial_policy_to_string(InitialPolicy policy) {
    switch (policy) {
        case InitialPolicy::START_FLAT:
            return "START_FLAT";
        case InitialPolicy::START_INVESTED:
            return "START_INVESTED";
        case InitialPolicy::START_INVESTED_IF_ABOVE:
            return "START_INVESTED_IF_ABOVE";
        default:
            return "UNKNOWN";
    }
}

std::string moving_average_type_to_string(MovingAverageType type) {
    return type == MovingAverageType::EMA ? "EMA" : "SMA";
}

Result<InitialPolicy> initial_policy_from_string(const std::string& str) {
    if (str == "START_FLAT")
        return InitialPolicy::START_FLAT;
    if (str == "START_INVESTED")
        return InitialPolicy::START_INVESTED;
    if (str == "START_INVESTED_IF_ABOVE")
        return InitialPolicy::START_INVESTED_IF_ABOVE;
    return make_error<InitialPolicy>(ErrorCode::INVALID_ARGUMENT,
                                     "Unknown initial policy: " + str, "Types");
}

Result<MovingAverageType> moving_average_type_from_string(const std::string& str) {
    if (str == "SMA")
        return MovingAverageType::SMA;
    if (str == "EMA")
        return MovingAverageType::EMA;
    return make_error<MovingAverageType>(ErrorCode::INVALID_ARGUMENT,
                                         "Unknown moving average type: " + str, "Types");
}

}  // namespace trend_lab
