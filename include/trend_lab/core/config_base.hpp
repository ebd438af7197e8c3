// include/trend_lab/core/config_base.hpp
#pragma once

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>
#include "trend_lab/core/error.hpp"

namespace trend_lab {

/**
 * @brief JSON-backed settings shared by LoggerConfig, CsvSourceConfig,
 * BacktestConfig and MomentumConfig
 *
 * Derived configs read only the keys present in the JSON object, so missing
 * keys keep their defaults. Dates are "YYYY-MM-DD" strings and enums their
 * upper-case names.
 */
class ConfigBase {
public:
    virtual ~ConfigBase() = default;

    /**
     * @brief Write to_json() to filepath, indented
     * @return FILE_IO_ERROR if the file cannot be opened
     */
    virtual Result<void> save_to_file(const std::string& filepath) const;

    /**
     * @brief Parse filepath and apply it through from_json()
     * @return FILE_IO_ERROR if the file cannot be opened, JSON_PARSE_ERROR if it is
     * not valid JSON, the code of a TrendLabError thrown by from_json() (for example
     * CONVERSION_ERROR on a malformed date) and INVALID_ARGUMENT for any other
     * rejected value
     */
    virtual Result<void> load_from_file(const std::string& filepath);

    virtual nlohmann::json to_json() const = 0;

    /**
     * @throws TrendLabError or nlohmann::json::exception on malformed values
     */
    virtual void from_json(const nlohmann::json& j) = 0;
};

}  // namespace trend_lab
