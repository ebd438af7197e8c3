// src/data/price_source.cpp

#include "trend_lab/data/price_source.hpp"
#include <cmath>
#include "trend_lab/core/time_utils.hpp"

namespace trend_lab {

Result<void> validate_price_series(const PriceSeries& series) {
    for (size_t i = 0; i < series.points.size(); ++i) {
        const auto& point = series.points[i];
        if (!std::isfinite(point.price) || point.price <= 0.0) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Non-positive price for " + series.symbol + " on " +
                                        core::format_date(point.timestamp),
                                    "PriceSource");
        }
        if (i > 0 && point.timestamp <= series.points[i - 1].timestamp) {
            return make_error<void>(ErrorCode::INVALID_DATA,
                                    "Dates of " + series.symbol +
                                        " are not strictly increasing at " +
                                        core::format_date(point.timestamp),
                                    "PriceSource");
        }
    }
    return Result<void>();
}

}  // namespace trend_lab
