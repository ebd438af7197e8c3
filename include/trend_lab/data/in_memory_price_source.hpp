// include/trend_lab/data/in_memory_price_source.hpp

#pragma once

#include <map>
#include <mutex>
#include "trend_lab/data/price_source.hpp"

namespace trend_lab {

/**
 * @brief PriceSource backed by series handed over by the caller
 */
class InMemoryPriceSource : public PriceSource {
public:
    InMemoryPriceSource() = default;

    /**
     * @brief Register or replace the history of a symbol
     * @return INVALID_ARGUMENT for an empty symbol, INVALID_DATA for a malformed series
     */
    Result<void> add_series(PriceSeries series);

    void remove_series(const std::string& symbol);

    Result<PriceSeries> get_price_series(const std::string& symbol) const override;
    Result<std::set<std::string>> list_available_symbols() const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, PriceSeries> series_;
};

}  // namespace trend_lab
