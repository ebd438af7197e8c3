// include/trend_lab/data/csv_price_source.hpp

#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <vector>
#include "trend_lab/core/config_base.hpp"
#include "trend_lab/data/price_source.hpp"

namespace trend_lab {

/**
 * @brief Location and layout of per-symbol CSV price files
 */
struct CsvSourceConfig : public ConfigBase {
    std::string data_directory{"data"};  // Holds one <SYMBOL>.csv per instrument
    std::string date_column{"Date"};
    std::vector<std::string> price_columns{"Adj Close", "Close", "Price"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief PriceSource reading <data_directory>/<SYMBOL>.csv through Arrow's CSV reader
 */
class CsvPriceSource : public PriceSource {
public:
    explicit CsvPriceSource(CsvSourceConfig config);

    Result<PriceSeries> get_price_series(const std::string& symbol) const override;
    Result<std::set<std::string>> list_available_symbols() const override;

    const CsvSourceConfig& config() const {
        return config_;
    }

private:
    CsvSourceConfig config_;

    Result<std::shared_ptr<arrow::Table>> read_table(const std::string& path) const;
};

}  // namespace trend_lab
