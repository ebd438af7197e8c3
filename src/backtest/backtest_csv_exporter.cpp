// src/backtest/backtest_csv_exporter.cpp
#include "trend_lab/backtest/backtest_csv_exporter.hpp"
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include "trend_lab/core/logger.hpp"
#include "trend_lab/core/time_utils.hpp"

namespace trend_lab {
namespace backtest {

BacktestCSVExporter::BacktestCSVExporter(std::string output_directory)
    : output_directory_(std::move(output_directory)) {}

std::string BacktestCSVExporter::format_number(double value) {
    if (!std::isfinite(value)) {
        return "";
    }
    std::ostringstream ss;
    ss << std::setprecision(10) << value;
    return ss.str();
}

void BacktestCSVExporter::write_summary_row(std::ostream& out, const PerformanceSummary& summary) {
    out << summary.name << ',' << format_number(summary.final_multiplier) << ','
        << format_number(summary.final_capital) << ',' << format_number(summary.total_return)
        << ',' << format_number(summary.cagr) << ',' << format_number(summary.max_drawdown) << ','
        << format_number(summary.annualized_volatility) << ','
        << format_number(summary.sharpe_ratio) << ',' << format_number(summary.sortino_ratio)
        << ',' << format_number(summary.calmar_ratio) << ',' << summary.trade_count << ','
        << summary.buy_count << ',' << summary.sell_count << '\n';
}

Result<void> BacktestCSVExporter::open_file(const std::string& filename, std::ofstream& out) const {
    std::error_code ec;
    std::filesystem::create_directories(output_directory_, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create " + output_directory_ + ": " + ec.message(),
                                "BacktestCSVExporter");
    }

    out.open(std::filesystem::path(output_directory_) / filename);
    if (!out.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open " + filename + " for writing",
                                "BacktestCSVExporter");
    }
    return Result<void>();
}

Result<void> BacktestCSVExporter::close_file(const std::string& filename,
                                             std::ofstream& out) const {
    out.close();
    if (out.fail()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR, "Failed to write " + filename,
                                "BacktestCSVExporter");
    }
    DEBUG("Wrote " << (std::filesystem::path(output_directory_) / filename).string());
    return Result<void>();
}

Result<void> BacktestCSVExporter::export_results(const BacktestResults& results) const {
    auto daily = write_daily(results);
    if (daily.is_error()) {
        return daily;
    }

    auto summary = write_summary(results);
    if (summary.is_error()) {
        return summary;
    }

    auto monthly = write_monthly_returns(results);
    if (monthly.is_error()) {
        return monthly;
    }

    INFO("Exported backtest results to " << output_directory_);
    return Result<void>();
}

Result<void> BacktestCSVExporter::write_daily(const BacktestResults& results) const {
    std::ofstream out;
    auto opened = open_file("daily.csv", out);
    if (opened.is_error()) {
        return opened;
    }

    out << "date,signal_price,traded_price,moving_average,signal,position,"
        << "strategy,bh_traded,bh_signal,drawdown\n";

    const auto& window = results.window;
    for (size_t i = 0; i < window.size(); ++i) {
        out << core::format_date(window.dates[i]) << ',' << format_number(window.signal_prices[i])
            << ',' << format_number(window.traded_prices[i]) << ','
            << format_number(i < results.signals.size() ? results.signals.moving_average[i]
                                                        : std::nan(""))
            << ','
            << (i < results.signals.size() ? signal_to_string(results.signals.signals[i]) : "")
            << ','
            << (i < results.positions.size()
                    ? position_state_to_string(results.positions.states[i])
                    : "")
            << ',';

        if (i < results.curves.strategy.size()) {
            out << format_number(results.curves.strategy.values[i]) << ','
                << format_number(results.curves.bh_traded.values[i]) << ','
                << format_number(results.curves.bh_signal.values[i]);
        } else {
            out << ",,";
        }
        out << ','
            << (i < results.drawdowns.size() ? format_number(results.drawdowns[i].second) : "")
            << '\n';
    }

    return close_file("daily.csv", out);
}

Result<void> BacktestCSVExporter::write_summary(const BacktestResults& results) const {
    std::ofstream out;
    auto opened = open_file("summary.csv", out);
    if (opened.is_error()) {
        return opened;
    }

    out << "curve,final_multiplier,final_capital,total_return,cagr,max_drawdown,"
        << "annualized_volatility,sharpe_ratio,sortino_ratio,calmar_ratio,"
        << "trade_count,buy_count,sell_count\n";

    write_summary_row(out, results.summaries.strategy);
    write_summary_row(out, results.summaries.bh_traded);
    write_summary_row(out, results.summaries.bh_signal);

    return close_file("summary.csv", out);
}

Result<void> BacktestCSVExporter::write_monthly_returns(const BacktestResults& results) const {
    std::ofstream out;
    auto opened = open_file("monthly_returns.csv", out);
    if (opened.is_error()) {
        return opened;
    }

    out << "month,return\n";
    for (const auto& [month, ret] : results.monthly_returns) {
        out << month << ',' << format_number(ret) << '\n';
    }

    return close_file("monthly_returns.csv", out);
}

Result<void> BacktestCSVExporter::export_momentum(
    const std::vector<momentum::MomentumEntry>& ranking) const {
    std::ofstream out;
    auto opened = open_file("momentum.csv", out);
    if (opened.is_error()) {
        return opened;
    }

    out << "rank,symbol,trailing_return,end_date,end_price,start_date,start_price,"
        << "end_moving_average\n";
    for (const auto& entry : ranking) {
        out << entry.rank << ',' << entry.symbol << ',' << format_number(entry.trailing_return)
            << ',' << core::format_date(entry.end_date) << ',' << format_number(entry.end_price)
            << ',' << core::format_date(entry.start_date) << ','
            << format_number(entry.start_price) << ',' << format_number(entry.end_moving_average)
            << '\n';
    }

    return close_file("momentum.csv", out);
}

}  // namespace backtest
}  // namespace trend_lab
