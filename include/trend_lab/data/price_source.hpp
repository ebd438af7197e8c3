// include/trend_lab/data/price_source.hpp

#pragma once

#include <set>
#include <string>
#include "trend_lab/core/error.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {

/**
 * @brief Abstract interface for daily price history providers
 * Defines the contract that any ingestion layer must fulfill
 */
class PriceSource {
public:
    virtual ~PriceSource() = default;

    /**
     * @brief Get the full price history of a symbol
     * @param symbol Instrument identifier
     * @return Date-ascending series without duplicate dates.
     *         NOT_FOUND if the symbol has no backing data,
     *         EMPTY_SERIES if the data exists but holds no usable rows
     */
    virtual Result<PriceSeries> get_price_series(const std::string& symbol) const = 0;

    /**
     * @brief List every symbol this source can serve
     */
    virtual Result<std::set<std::string>> list_available_symbols() const = 0;
};

/**
 * @brief Check ordering and price sanity of a series
 * @return INVALID_DATA on non-increasing dates or non-positive/non-finite prices
 */
Result<void> validate_price_series(const PriceSeries& series);

}  // namespace trend_lab
