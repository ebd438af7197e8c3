#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include "trend_lab/backtest/backtest_csv_exporter.hpp"
#include "trend_lab/backtest/backtest_engine.hpp"
#include "trend_lab/core/logger.hpp"
#include "trend_lab/core/time_utils.hpp"
#include "trend_lab/data/csv_price_source.hpp"

using namespace trend_lab;
using namespace trend_lab::backtest;

namespace {

/**
 * @brief Layout of the application's JSON file
 *
 * {
 *   "backtest": { ...BacktestConfig... },
 *   "data":     { ...CsvSourceConfig... },
 *   "logging":  { ...LoggerConfig... },
 *   "output_directory": "results/trend_filter"
 * }
 */
struct TrendFilterAppConfig : public ConfigBase {
    BacktestConfig backtest;
    CsvSourceConfig data;
    LoggerConfig logging;
    std::string output_directory{"results/trend_filter"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["backtest"] = backtest.to_json();
        j["data"] = data.to_json();
        j["logging"] = logging.to_json();
        j["output_directory"] = output_directory;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("backtest"))
            backtest.from_json(j.at("backtest"));
        if (j.contains("data"))
            data.from_json(j.at("data"));
        if (j.contains("logging"))
            logging.from_json(j.at("logging"));
        if (j.contains("output_directory"))
            output_directory = j.at("output_directory").get<std::string>();
    }
};

void print_summary(const PerformanceSummary& summary) {
    INFO(std::left << std::setw(10) << summary.name << std::fixed << std::setprecision(4)
                   << " multiplier=" << summary.final_multiplier
                   << " capital=" << std::setprecision(2) << summary.final_capital
                   << std::setprecision(4) << " CAGR=" << summary.cagr
                   << " MaxDD=" << summary.max_drawdown
                   << " Vol=" << summary.annualized_volatility
                   << " Sharpe=" << summary.sharpe_ratio << " Sortino=" << summary.sortino_ratio
                   << " Calmar=" << summary.calmar_ratio << " trades=" << summary.trade_count);
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "./config.json";

    TrendFilterAppConfig app_config;
    auto load_result = app_config.load_from_file(config_path);
    if (load_result.is_error()) {
        std::cerr << "Failed to load " << config_path << ": "
                  << load_result.error()->to_string() << std::endl;
        return 1;
    }

    try {
        Logger::reset_for_tests();
        app_config.logging.filename_prefix = "bt_trend_filter";
        Logger::instance().initialize(app_config.logging);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: Logger initialization failed: " << e.what() << std::endl;
        return 1;
    }

    INFO("Loaded configuration from " << config_path);

    auto source = std::make_shared<CsvPriceSource>(app_config.data);
    BacktestEngine engine(source);

    auto run_result = engine.run_backtest(app_config.backtest);
    if (run_result.is_error()) {
        ERROR("Backtest failed: " << run_result.error()->to_string());
        return 1;
    }
    const BacktestResults& results = run_result.value();

    INFO("Analysis window " << core::format_date(results.window.dates.front()) << " to "
                            << core::format_date(results.window.dates.back()) << " ("
                            << results.window.size() << " trading days)");
    print_summary(results.summaries.strategy);
    print_summary(results.summaries.bh_traded);
    print_summary(results.summaries.bh_signal);

    BacktestCSVExporter exporter(app_config.output_directory);
    auto export_result = exporter.export_results(results);
    if (export_result.is_error()) {
        ERROR("Export failed: " << export_result.error()->to_string());
        return 1;
    }

    return 0;
}
