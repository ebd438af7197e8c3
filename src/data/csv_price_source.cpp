// src/data/csv_price_source.cpp

#include "trend_lab/data/csv_price_source.hpp"
#include <arrow/csv/api.h>
#include <arrow/io/api.h>
#include <filesystem>
#include "trend_lab/core/logger.hpp"
#include "trend_lab/data/conversion_utils.hpp"

namespace trend_lab {

nlohmann::json CsvSourceConfig::to_json() const {
    nlohmann::json j;
    j["data_directory"] = data_directory;
    j["date_column"] = date_column;
    j["price_columns"] = price_columns;
    return j;
}

void CsvSourceConfig::from_json(const nlohmann::json& j) {
    if (j.contains("data_directory"))
        data_directory = j.at("data_directory").get<std::string>();
    if (j.contains("date_column"))
        date_column = j.at("date_column").get<std::string>();
    if (j.contains("price_columns"))
        price_columns = j.at("price_columns").get<std::vector<std::string>>();
}

CsvPriceSource::CsvPriceSource(CsvSourceConfig config) : config_(std::move(config)) {}

Result<std::shared_ptr<arrow::Table>> CsvPriceSource::read_table(const std::string& path) const {
    auto input_result = arrow::io::ReadableFile::Open(path);
    if (!input_result.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to open " + path + ": " + input_result.status().ToString(),
            "CsvPriceSource");
    }
    std::shared_ptr<arrow::io::InputStream> input = *input_result;

    auto read_options = arrow::csv::ReadOptions::Defaults();
    auto parse_options = arrow::csv::ParseOptions::Defaults();
    auto convert_options = arrow::csv::ConvertOptions::Defaults();

    // Dates are parsed by us; column types only apply to columns that exist
    convert_options.column_types[config_.date_column] = arrow::utf8();
    for (const auto& column : config_.price_columns) {
        convert_options.column_types[column] = arrow::float64();
    }

    auto reader_result =
        arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, read_options,
                                      parse_options, convert_options);
    if (!reader_result.ok()) {
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to create CSV reader for " + path + ": " + reader_result.status().ToString(),
            "CsvPriceSource");
    }

    auto table_result = (*reader_result)->Read();
    if (!table_result.ok()) {
        // Arrow refuses files without a header row; treat them as carrying no rows
        return make_error<std::shared_ptr<arrow::Table>>(
            ErrorCode::EMPTY_SERIES,
            "Failed to read " + path + ": " + table_result.status().ToString(),
            "CsvPriceSource");
    }

    return *table_result;
}

Result<PriceSeries> CsvPriceSource::get_price_series(const std::string& symbol) const {
    Logger::register_component("CsvPriceSource");

    std::filesystem::path path =
        std::filesystem::path(config_.data_directory) / (symbol + ".csv");
    std::error_code ec;
    if (symbol.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return make_error<PriceSeries>(ErrorCode::NOT_FOUND,
                                       "CSV file not found: " + path.string(), "CsvPriceSource");
    }

    if (std::filesystem::file_size(path, ec) == 0 && !ec) {
        return make_error<PriceSeries>(ErrorCode::EMPTY_SERIES,
                                       "CSV file is empty: " + path.string(), "CsvPriceSource");
    }

    auto table_result = read_table(path.string());
    if (table_result.is_error()) {
        return forward_error<PriceSeries>(table_result);
    }

    auto series_result = PriceTableConverter::arrow_table_to_series(
        table_result.value(), symbol, config_.date_column, config_.price_columns);
    if (series_result.is_error()) {
        return series_result;
    }

    if (series_result.value().empty()) {
        return make_error<PriceSeries>(ErrorCode::EMPTY_SERIES,
                                       "No usable rows in " + path.string(), "CsvPriceSource");
    }

    DEBUG("Loaded " << series_result.value().size() << " rows for " << symbol);
    return series_result;
}

Result<std::set<std::string>> CsvPriceSource::list_available_symbols() const {
    std::set<std::string> symbols;

    std::error_code ec;
    if (!std::filesystem::is_directory(config_.data_directory, ec)) {
        return symbols;
    }

    for (const auto& entry : std::filesystem::directory_iterator(config_.data_directory, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".csv") {
            symbols.insert(entry.path().stem().string());
        }
    }

    if (ec) {
        return make_error<std::set<std::string>>(
            ErrorCode::FILE_IO_ERROR,
            "Failed to list " + config_.data_directory + ": " + ec.message(), "CsvPriceSource");
    }
    return symbols;
}

}  // namespace trend_lab
