// include/trend_lab/backtest/backtest_csv_exporter.hpp
#pragma once

#include <fstream>
#include <ostream>
#include <string>
#include <vector>
#include "trend_lab/backtest/backtest_engine.hpp"
#include "trend_lab/core/error.hpp"
#include "trend_lab/momentum/momentum_ranker.hpp"

namespace trend_lab {
namespace backtest {

/**
 * @brief Writes backtest and ranking results as CSV files
 *
 * Files produced in the output directory:
 * - daily.csv: one row per analysis date
 * - summary.csv: one row per equity curve
 * - monthly_returns.csv: compounded strategy return per month
 * - momentum.csv: ranking table
 *
 * Undefined metrics are written as empty fields.
 */
class BacktestCSVExporter {
public:
    explicit BacktestCSVExporter(std::string output_directory);

    /**
     * @brief Write daily.csv, summary.csv and monthly_returns.csv
     * @return FILE_IO_ERROR if a file cannot be created or written
     */
    Result<void> export_results(const BacktestResults& results) const;

    /**
     * @brief Write momentum.csv
     * @return FILE_IO_ERROR if the file cannot be created or written
     */
    Result<void> export_momentum(const std::vector<momentum::MomentumEntry>& ranking) const;

    const std::string& output_directory() const {
        return output_directory_;
    }

private:
    std::string output_directory_;

    Result<void> open_file(const std::string& filename, std::ofstream& out) const;
    Result<void> close_file(const std::string& filename, std::ofstream& out) const;

    Result<void> write_daily(const BacktestResults& results) const;
    Result<void> write_summary(const BacktestResults& results) const;
    Result<void> write_monthly_returns(const BacktestResults& results) const;

    static std::string format_number(double value);
    static void write_summary_row(std::ostream& out, const PerformanceSummary& summary);
};

}  // namespace backtest
}  // namespace trend_lab
