// src/momentum/momentum_ranker.cpp

#include "trend_lab/momentum/momentum_ranker.hpp"
#include <algorithm>
#include <limits>
#include "trend_lab/core/logger.hpp"
#include "trend_lab/core/time_utils.hpp"
#include "trend_lab/data/price_source.hpp"

namespace trend_lab {
namespace momentum {

Result<void> MomentumConfig::validate() const {
    if (staleness_tolerance_days < 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Staleness tolerance cannot be negative", "MomentumConfig");
    }
    if (lookback_months < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Lookback must be at least one month", "MomentumConfig");
    }
    if (moving_average_window < 1) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Moving average window must be positive", "MomentumConfig");
    }
    return Result<void>();
}

nlohmann::json MomentumConfig::to_json() const {
    nlohmann::json j;
    j["staleness_tolerance_days"] = staleness_tolerance_days;
    j["lookback_months"] = lookback_months;
    j["moving_average_window"] = moving_average_window;
    return j;
}

void MomentumConfig::from_json(const nlohmann::json& j) {
    if (j.contains("staleness_tolerance_days"))
        staleness_tolerance_days = j.at("staleness_tolerance_days").get<int>();
    if (j.contains("lookback_months"))
        lookback_months = j.at("lookback_months").get<int>();
    if (j.contains("moving_average_window"))
        moving_average_window = j.at("moving_average_window").get<int>();
}

nlohmann::json MomentumEntry::to_json() const {
    nlohmann::json j;
    j["rank"] = rank;
    j["symbol"] = symbol;
    j["trailing_return"] = trailing_return;
    j["end_price"] = end_price;
    j["end_date"] = core::format_date(end_date);
    j["start_price"] = start_price;
    j["start_date"] = core::format_date(start_date);
    j["end_moving_average"] = end_moving_average;
    return j;
}

MomentumRanker::MomentumRanker(MomentumConfig config) : config_(std::move(config)) {}

Timestamp MomentumRanker::end_reference(const Timestamp& as_of) const {
    return core::last_day_of_previous_month(as_of);
}

Timestamp MomentumRanker::start_reference(const Timestamp& end_ref) const {
    return core::subtract_months(end_ref, config_.lookback_months);
}

std::optional<size_t> MomentumRanker::latest_at_or_before(const PriceSeries& series,
                                                          const Timestamp& date) {
    const int64_t day = core::days_since_epoch(date);
    auto it = std::upper_bound(series.points.begin(), series.points.end(), day,
                               [](int64_t d, const PricePoint& point) {
                                   return d < core::days_since_epoch(point.timestamp);
                               });
    if (it == series.points.begin()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(series.points.begin(), it) - 1);
}

double MomentumRanker::trailing_average(const PriceSeries& series, size_t end_index) const {
    const size_t window = static_cast<size_t>(config_.moving_average_window);
    if (end_index + 1 < window) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    double sum = 0.0;
    for (size_t i = end_index + 1 - window; i <= end_index; ++i) {
        sum += series.points[i].price;
    }
    return sum / static_cast<double>(window);
}

std::optional<MomentumEntry> MomentumRanker::evaluate(const PriceSeries& series,
                                                      const Timestamp& end_ref,
                                                      const Timestamp& start_ref) const {
    // Reference lookups binary-search the points by date
    auto valid = validate_price_series(series);
    if (valid.is_error()) {
        DEBUG("Excluding " << series.symbol << ": " << valid.error()->what());
        return std::nullopt;
    }

    auto end_index = latest_at_or_before(series, end_ref);
    if (!end_index) {
        DEBUG("Excluding " << series.symbol << ": no price on or before "
                           << core::format_date(end_ref));
        return std::nullopt;
    }

    const PricePoint& end_point = series.points[*end_index];
    int64_t staleness = core::days_between(end_point.timestamp, end_ref);
    if (staleness > config_.staleness_tolerance_days) {
        DEBUG("Excluding " << series.symbol << ": last price " << core::format_date(end_point.timestamp)
                           << " is " << staleness << " days before " << core::format_date(end_ref));
        return std::nullopt;
    }

    auto start_index = latest_at_or_before(series, start_ref);
    if (!start_index) {
        DEBUG("Excluding " << series.symbol << ": no price on or before "
                           << core::format_date(start_ref));
        return std::nullopt;
    }

    const PricePoint& start_point = series.points[*start_index];

    MomentumEntry entry;
    entry.symbol = series.symbol;
    entry.end_price = end_point.price;
    entry.end_date = core::floor_to_day(end_point.timestamp);
    entry.start_price = start_point.price;
    entry.start_date = core::floor_to_day(start_point.timestamp);
    entry.trailing_return = end_point.price / start_point.price - 1.0;
    entry.end_moving_average = trailing_average(series, *end_index);
    return entry;
}

Result<std::vector<MomentumEntry>> MomentumRanker::rank(
    const std::map<std::string, PriceSeries>& universe, const Timestamp& as_of) const {
    auto valid = config_.validate();
    if (valid.is_error()) {
        return forward_error<std::vector<MomentumEntry>>(valid);
    }

    const Timestamp end_ref = end_reference(as_of);
    const Timestamp start_ref = start_reference(end_ref);

    std::vector<MomentumEntry> entries;
    entries.reserve(universe.size());

    for (const auto& [symbol, series] : universe) {
        auto entry = evaluate(series, end_ref, start_ref);
        if (entry) {
            entry->symbol = symbol;
            entries.push_back(std::move(*entry));
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const MomentumEntry& a, const MomentumEntry& b) {
                  if (a.trailing_return != b.trailing_return) {
                      return a.trailing_return > b.trailing_return;
                  }
                  return a.symbol < b.symbol;
              });

    for (size_t i = 0; i < entries.size(); ++i) {
        entries[i].rank = static_cast<int>(i) + 1;
    }

    DEBUG("Ranked " << entries.size() << " of " << universe.size() << " instruments between "
                    << core::format_date(start_ref) << " and " << core::format_date(end_ref));

    return entries;
}

}  // namespace momentum
}  // namespace trend_lab
