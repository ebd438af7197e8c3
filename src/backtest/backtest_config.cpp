// src/backtest/backtest_config.cpp

#include "trend_lab/backtest/backtest_config.hpp"
#include "trend_lab/core/time_utils.hpp"

namespace trend_lab {
namespace backtest {

namespace {

Timestamp date_from_json(const nlohmann::json& j, const std::string& key) {
    auto parsed = core::parse_date(j.at(key).get<std::string>());
    if (parsed.is_error()) {
        throw TrendLabError(parsed.error()->code(),
                            "Invalid " + key + ": " + parsed.error()->what(), "BacktestConfig");
    }
    return parsed.value();
}

}  // namespace

Result<void> BacktestConfig::validate() const {
    if (signal_symbol.empty() || traded_symbol.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Both signal and traded symbols are required", "BacktestConfig");
    }
    if (start_date >= end_date) {
        return make_error<void>(ErrorCode::INVALID_RANGE,
                                "Start date " + core::format_date(start_date) +
                                    " must be earlier than end date " +
                                    core::format_date(end_date),
                                "BacktestConfig");
    }
    if (window_length < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Window length must be positive, got " +
                                    std::to_string(window_length),
                                "BacktestConfig");
    }
    if (!(initial_capital > 0.0)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Initial capital must be positive",
                                "BacktestConfig");
    }
    if (min_buffer_days < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Minimum buffer days cannot be negative", "BacktestConfig");
    }
    return Result<void>();
}

nlohmann::json BacktestConfig::to_json() const {
    nlohmann::json j;
    j["signal_symbol"] = signal_symbol;
    j["traded_symbol"] = traded_symbol;
    j["start_date"] = core::format_date(start_date);
    j["end_date"] = core::format_date(end_date);
    j["window_length"] = window_length;
    j["initial_policy"] = initial_policy_to_string(initial_policy);
    j["moving_average_type"] = moving_average_type_to_string(moving_average_type);
    j["initial_capital"] = initial_capital;
    j["min_buffer_days"] = min_buffer_days;
    return j;
}

void BacktestConfig::from_json(const nlohmann::json& j) {
    if (j.contains("signal_symbol"))
        signal_symbol = j.at("signal_symbol").get<std::string>();
    if (j.contains("traded_symbol"))
        traded_symbol = j.at("traded_symbol").get<std::string>();
    if (j.contains("start_date"))
        start_date = date_from_json(j, "start_date");
    if (j.contains("end_date"))
        end_date = date_from_json(j, "end_date");
    if (j.contains("window_length"))
        window_length = j.at("window_length").get<int>();
    if (j.contains("initial_policy")) {
        auto policy = initial_policy_from_string(j.at("initial_policy").get<std::string>());
        if (policy.is_error()) {
            throw *policy.error();
        }
        initial_policy = policy.value();
    }
    if (j.contains("moving_average_type")) {
        auto type = moving_average_type_from_string(j.at("moving_average_type").get<std::string>());
        if (type.is_error()) {
            throw *type.error();
        }
        moving_average_type = type.value();
    }
    if (j.contains("initial_capital"))
        initial_capital = j.at("initial_capital").get<double>();
    if (j.contains("min_buffer_days"))
        min_buffer_days = j.at("min_buffer_days").get<int>();
}

}  // namespace backtest
}  // namespace trend_lab
