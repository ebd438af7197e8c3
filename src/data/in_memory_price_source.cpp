// src/data/in_memory_price_source.cpp

#include "trend_lab/data/in_memory_price_source.hpp"

namespace trend_lab {

Result<void> InMemoryPriceSource::add_series(PriceSeries series) {
    if (series.symbol.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Series symbol cannot be empty",
                                "InMemoryPriceSource");
    }

    auto valid = validate_price_series(series);
    if (valid.is_error()) {
        return valid;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::string symbol = series.symbol;
    series_[symbol] = std::move(series);
    return Result<void>();
}

void InMemoryPriceSource::remove_series(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    series_.erase(symbol);
}

Result<PriceSeries> InMemoryPriceSource::get_price_series(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(symbol);
    if (it == series_.end()) {
        return make_error<PriceSeries>(ErrorCode::NOT_FOUND, "No price data for " + symbol,
                                       "InMemoryPriceSource");
    }
    if (it->second.empty()) {
        return make_error<PriceSeries>(ErrorCode::EMPTY_SERIES,
                                       "Price data for " + symbol + " has no rows",
                                       "InMemoryPriceSource");
    }
    return PriceSeries(it->second);
}

Result<std::set<std::string>> InMemoryPriceSource::list_available_symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> symbols;
    for (const auto& [symbol, series] : series_) {
        symbols.insert(symbol);
    }
    return symbols;
}

}  // namespace trend_lab
