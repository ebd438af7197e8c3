#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "trend_lab/backtest/backtest_csv_exporter.hpp"
#include "trend_lab/backtest/backtest_engine.hpp"
#include "trend_lab/core/logger.hpp"
#include "trend_lab/core/time_utils.hpp"
#include "trend_lab/data/csv_price_source.hpp"

using namespace trend_lab;

namespace {

/**
 * @brief Layout of the application's JSON file
 *
 * {
 *   "data":     { ...CsvSourceConfig... },
 *   "momentum": { ...MomentumConfig... },
 *   "logging":  { ...LoggerConfig... },
 *   "output_directory": "results/momentum"
 * }
 */
struct MomentumAppConfig : public ConfigBase {
    CsvSourceConfig data;
    momentum::MomentumConfig momentum;
    LoggerConfig logging;
    std::string output_directory{"results/momentum"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["data"] = data.to_json();
        j["momentum"] = momentum.to_json();
        j["logging"] = logging.to_json();
        j["output_directory"] = output_directory;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("data"))
            data.from_json(j.at("data"));
        if (j.contains("momentum"))
            momentum.from_json(j.at("momentum"));
        if (j.contains("logging"))
            logging.from_json(j.at("logging"));
        if (j.contains("output_directory"))
            output_directory = j.at("output_directory").get<std::string>();
    }
};

std::vector<std::string> split_symbols(const std::string& list) {
    std::vector<std::string> symbols;
    std::stringstream ss(list);
    std::string symbol;
    while (std::getline(ss, symbol, ',')) {
        if (!symbol.empty()) {
            symbols.push_back(symbol);
        }
    }
    return symbols;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [config.json] [--symbols A,B,C] [--as-of YYYY-MM-DD]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "./config.json";
    std::optional<std::vector<std::string>> symbols;
    Timestamp as_of = core::today();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--symbols" && i + 1 < argc) {
            symbols = split_symbols(argv[++i]);
        } else if (arg == "--as-of" && i + 1 < argc) {
            auto parsed = core::parse_date(argv[++i]);
            if (parsed.is_error()) {
                std::cerr << parsed.error()->to_string() << std::endl;
                return 1;
            }
            as_of = parsed.value();
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] != '-') {
            config_path = arg;
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    MomentumAppConfig app_config;
    auto load_result = app_config.load_from_file(config_path);
    if (load_result.is_error()) {
        std::cerr << "Failed to load " << config_path << ": "
                  << load_result.error()->to_string() << std::endl;
        return 1;
    }

    try {
        Logger::reset_for_tests();
        app_config.logging.filename_prefix = "rank_momentum";
        Logger::instance().initialize(app_config.logging);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }

    auto source = std::make_shared<CsvPriceSource>(app_config.data);
    backtest::BacktestEngine engine(source);

    auto ranking_result = engine.rank_momentum(symbols, app_config.momentum, as_of);
    if (ranking_result.is_error()) {
        ERROR("Momentum ranking failed: " << ranking_result.error()->to_string());
        return 1;
    }
    const auto& ranking = ranking_result.value();

    std::cout << std::left << std::setw(6) << "Rank" << std::setw(10) << "Symbol" << std::right
              << std::setw(12) << "Return" << std::setw(14) << "End date" << std::setw(12)
              << "End price" << std::setw(14) << "Start date" << std::setw(12) << "Start price"
              << std::setw(12) << "SMA" << '\n';
    for (const auto& entry : ranking) {
        std::cout << std::left << std::setw(6) << entry.rank << std::setw(10) << entry.symbol
                  << std::right << std::fixed << std::setprecision(2) << std::setw(11)
                  << entry.trailing_return * 100.0 << '%' << std::setw(14)
                  << core::format_date(entry.end_date) << std::setw(12) << entry.end_price
                  << std::setw(14) << core::format_date(entry.start_date) << std::setw(12)
                  << entry.start_price << std::setw(12) << entry.end_moving_average << '\n';
    }
    std::cout << std::flush;

    backtest::BacktestCSVExporter exporter(app_config.output_directory);
    auto export_result = exporter.export_momentum(ranking);
    if (export_result.is_error()) {
        ERROR("Export failed: " << export_result.error()->to_string());
        return 1;
    }

    return 0;
}
