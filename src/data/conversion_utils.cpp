// src/data/conversion_utils.cpp
#include "trend_lab/data/conversion_utils.hpp"
#include <algorithm>
#include <arrow/type_traits.h>
#include "trend_lab/core/time_utils.hpp"

namespace trend_lab {

Result<PriceSeries> PriceTableConverter::arrow_table_to_series(
    const std::shared_ptr<arrow::Table>& table, const std::string& symbol,
    const std::string& date_column, const std::vector<std::string>& price_columns) {
    if (!table) {
        return make_error<PriceSeries>(ErrorCode::INVALID_ARGUMENT, "Table pointer is null",
                                       "PriceTableConverter");
    }

    if (table->GetColumnByName(date_column) == nullptr) {
        return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                       "Missing date column: " + date_column,
                                       "PriceTableConverter");
    }

    std::string price_column;
    for (const auto& candidate : price_columns) {
        if (table->GetColumnByName(candidate) != nullptr) {
            price_column = candidate;
            break;
        }
    }
    if (price_column.empty()) {
        return make_error<PriceSeries>(ErrorCode::INVALID_DATA,
                                       "No price column found for " + symbol,
                                       "PriceTableConverter");
    }

    PriceSeries series;
    series.symbol = symbol;
    if (table->num_rows() == 0) {
        return series;
    }

    auto combined_result = table->CombineChunks();
    if (!combined_result.ok()) {
        return make_error<PriceSeries>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine table chunks: " + combined_result.status().ToString(),
            "PriceTableConverter");
    }
    std::shared_ptr<arrow::Table> combined = *combined_result;

    auto date_array = combined->GetColumnByName(date_column)->chunk(0);
    auto price_array = combined->GetColumnByName(price_column)->chunk(0);

    std::vector<PricePoint> points;
    points.reserve(static_cast<size_t>(combined->num_rows()));

    for (int64_t i = 0; i < combined->num_rows(); ++i) {
        if (price_array->IsNull(i)) {
            continue;
        }

        auto date_result = extract_date(date_array, i);
        if (date_result.is_error()) {
            return make_error<PriceSeries>(date_result.error()->code(),
                                           date_result.error()->what() + (" at row " + std::to_string(i)),
                                           "PriceTableConverter");
        }

        auto price_result = extract_price(price_array, i);
        if (price_result.is_error()) {
            return make_error<PriceSeries>(price_result.error()->code(),
                                           price_result.error()->what() + (" at row " + std::to_string(i)),
                                           "PriceTableConverter");
        }

        double price = price_result.value();
        if (!(price > 0.0)) {
            continue;
        }
        points.emplace_back(date_result.value(), price);
    }

    // Stable sort keeps the first occurrence of a duplicated date in front
    std::stable_sort(points.begin(), points.end(),
                     [](const PricePoint& a, const PricePoint& b) {
                         return a.timestamp < b.timestamp;
                     });
    auto last = std::unique(points.begin(), points.end(),
                            [](const PricePoint& a, const PricePoint& b) {
                                return a.timestamp == b.timestamp;
                            });
    points.erase(last, points.end());

    series.points = std::move(points);
    return series;
}

Result<Timestamp> PriceTableConverter::extract_date(const std::shared_ptr<arrow::Array>& array,
                                                    int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                     "PriceTableConverter");
    }

    if (array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA, "Null date value",
                                     "PriceTableConverter");
    }

    switch (array->type_id()) {
        case arrow::Type::STRING: {
            auto str_array = std::static_pointer_cast<arrow::StringArray>(array);
            return core::parse_date(str_array->GetString(index));
        }
        case arrow::Type::LARGE_STRING: {
            auto str_array = std::static_pointer_cast<arrow::LargeStringArray>(array);
            return core::parse_date(str_array->GetString(index));
        }
        case arrow::Type::DATE32: {
            auto date_array = std::static_pointer_cast<arrow::Date32Array>(array);
            return core::add_days(Timestamp(), date_array->Value(index));
        }
        case arrow::Type::DATE64: {
            auto date_array = std::static_pointer_cast<arrow::Date64Array>(array);
            return core::floor_to_day(
                Timestamp(std::chrono::milliseconds(date_array->Value(index))));
        }
        case arrow::Type::TIMESTAMP: {
            auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
            auto ts_type = std::static_pointer_cast<arrow::TimestampType>(array->type());
            int64_t value = ts_array->Value(index);
            std::chrono::seconds secs;
            switch (ts_type->unit()) {
                case arrow::TimeUnit::SECOND:
                    secs = std::chrono::seconds(value);
                    break;
                case arrow::TimeUnit::MILLI:
                    secs = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::milliseconds(value));
                    break;
                case arrow::TimeUnit::MICRO:
                    secs = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::microseconds(value));
                    break;
                case arrow::TimeUnit::NANO:
                default:
                    secs = std::chrono::duration_cast<std::chrono::seconds>(
                        std::chrono::nanoseconds(value));
                    break;
            }
            return core::floor_to_day(Timestamp(secs));
        }
        default:
            return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                         "Unsupported date column type: " +
                                             array->type()->ToString(),
                                         "PriceTableConverter");
    }
}

Result<double> PriceTableConverter::extract_price(const std::shared_ptr<arrow::Array>& array,
                                                  int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_ARGUMENT, "Invalid array or index",
                                  "PriceTableConverter");
    }

    switch (array->type_id()) {
        case arrow::Type::DOUBLE:
            return std::static_pointer_cast<arrow::DoubleArray>(array)->Value(index);
        case arrow::Type::FLOAT:
            return static_cast<double>(
                std::static_pointer_cast<arrow::FloatArray>(array)->Value(index));
        case arrow::Type::INT64:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int64Array>(array)->Value(index));
        case arrow::Type::INT32:
            return static_cast<double>(
                std::static_pointer_cast<arrow::Int32Array>(array)->Value(index));
        default:
            return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                      "Unsupported price column type: " +
                                          array->type()->ToString(),
                                      "PriceTableConverter");
    }
}

}  // namespace trend_lab
