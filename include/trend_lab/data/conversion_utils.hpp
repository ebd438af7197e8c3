// include/trend_lab/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "trend_lab/core/error.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {

class PriceTableConverter {
public:
    /**
     * @brief Convert an Arrow table of daily observations to a PriceSeries
     *
     * The price column is the first of `price_columns` present in the table.
     * Rows with a null or non-positive price are dropped, rows are sorted by
     * date and the first row of a duplicated date wins.
     *
     * @param table Arrow table read from the ingestion layer
     * @param symbol Symbol stamped on the resulting series
     * @param date_column Name of the date column
     * @param price_columns Price column names in order of preference
     * @return Result containing the (possibly empty) series
     */
    static Result<PriceSeries> arrow_table_to_series(const std::shared_ptr<arrow::Table>& table,
                                                     const std::string& symbol,
                                                     const std::string& date_column,
                                                     const std::vector<std::string>& price_columns);

private:
    /**
     * @brief Extract a date from a string, date32, date64 or timestamp array
     * @param array Arrow array containing dates
     * @param index Row index
     * @return Result containing the midnight-UTC timestamp
     */
    static Result<Timestamp> extract_date(const std::shared_ptr<arrow::Array>& array,
                                          int64_t index);

    /**
     * @brief Extract a price from a floating point or integer array
     * @param array Arrow array containing prices
     * @param index Row index
     * @return Result containing the price
     */
    static Result<double> extract_price(const std::shared_ptr<arrow::Array>& array,
                                        int64_t index);
};

}  // namespace trend_lab
