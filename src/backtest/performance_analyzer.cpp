// src/backtest/performance_analyzer.cpp

#include "trend_lab/backtest/performance_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include "trend_lab/core/time_utils.hpp"

namespace trend_lab {
namespace backtest {

namespace {
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();
}

nlohmann::json PerformanceSummary::to_json() const {
    // nlohmann::json dumps NaN as null
    nlohmann::json j;
    j["name"] = name;
    j["final_multiplier"] = final_multiplier;
    j["final_capital"] = final_capital;
    j["total_return"] = total_return;
    j["cagr"] = cagr;
    j["max_drawdown"] = max_drawdown;
    j["annualized_volatility"] = annualized_volatility;
    j["sharpe_ratio"] = sharpe_ratio;
    j["sortino_ratio"] = sortino_ratio;
    j["calmar_ratio"] = calmar_ratio;
    j["years"] = years;
    j["trade_count"] = trade_count;
    j["buy_count"] = buy_count;
    j["sell_count"] = sell_count;
    return j;
}

// ========== Return Calculations ==========

double PerformanceAnalyzer::calculate_total_return(double start_value, double end_value) const {
    if (start_value <= 0.0) {
        return NaN;
    }
    return end_value / start_value - 1.0;
}

double PerformanceAnalyzer::calculate_years(const Timestamp& first_date,
                                            const Timestamp& last_date) const {
    return static_cast<double>(core::days_between(first_date, last_date)) / DAYS_PER_YEAR;
}

double PerformanceAnalyzer::calculate_cagr(double total_return, double years) const {
    if (!(years > 0.0)) {
        return NaN;
    }
    return std::pow(1.0 + total_return, 1.0 / years) - 1.0;
}

// ========== Risk-Adjusted Return Metrics ==========

double PerformanceAnalyzer::calculate_sharpe_ratio(const std::vector<double>& returns) const {
    if (returns.size() <= 1) {
        return NaN;
    }

    double mean_return = calculate_mean(returns);
    double std_dev = calculate_sample_std_dev(returns, mean_return);
    if (!(std_dev > 0.0)) {
        return NaN;
    }

    return mean_return / std_dev * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double PerformanceAnalyzer::calculate_sortino_ratio(const std::vector<double>& returns) const {
    if (returns.size() <= 1) {
        return NaN;
    }

    std::vector<double> negative_returns;
    for (double ret : returns) {
        if (ret < 0.0) {
            negative_returns.push_back(ret);
        }
    }

    double downside_std =
        calculate_sample_std_dev(negative_returns, calculate_mean(negative_returns));
    if (!(downside_std > 0.0)) {
        return NaN;
    }

    return calculate_mean(returns) / downside_std * std::sqrt(TRADING_DAYS_PER_YEAR);
}

double PerformanceAnalyzer::calculate_calmar_ratio(double cagr, double max_drawdown) const {
    if (!(max_drawdown > 0.0)) {
        return NaN;
    }
    return cagr / max_drawdown;
}

// ========== Volatility Metrics ==========

double PerformanceAnalyzer::calculate_volatility(const std::vector<double>& returns) const {
    if (returns.size() <= 1) {
        return NaN;
    }

    double mean_return = calculate_mean(returns);
    return calculate_sample_std_dev(returns, mean_return) * std::sqrt(TRADING_DAYS_PER_YEAR);
}

// ========== Drawdown Metrics ==========

std::vector<std::pair<Timestamp, double>> PerformanceAnalyzer::calculate_drawdowns(
    const EquityCurve& curve) const {
    std::vector<std::pair<Timestamp, double>> drawdowns;
    drawdowns.reserve(curve.size());

    if (curve.empty()) {
        return drawdowns;
    }

    double peak = curve.values[0];
    for (size_t i = 0; i < curve.size(); ++i) {
        peak = std::max(peak, curve.values[i]);
        double drawdown = peak > 0.0 ? 1.0 - curve.values[i] / peak : 0.0;
        drawdowns.emplace_back(curve.dates[i], drawdown);
    }

    return drawdowns;
}

double PerformanceAnalyzer::calculate_max_drawdown(const std::vector<double>& values) const {
    double peak = values.empty() ? 0.0 : values[0];
    double max_dd = 0.0;

    for (double value : values) {
        peak = std::max(peak, value);
        if (peak > 0.0) {
            max_dd = std::max(max_dd, 1.0 - value / peak);
        }
    }
    return max_dd;
}

// ========== Aggregations ==========

std::map<std::string, double> PerformanceAnalyzer::calculate_monthly_returns(
    const EquityCurve& curve) const {
    std::map<std::string, double> growth;

    for (size_t i = 0; i < curve.size(); ++i) {
        std::string month_key = core::format_month(curve.dates[i]);
        double daily = i < curve.returns.size() ? curve.returns[i] : 0.0;
        auto it = growth.find(month_key);
        if (it == growth.end()) {
            growth.emplace(month_key, 1.0 + daily);
        } else {
            it->second *= (1.0 + daily);
        }
    }

    for (auto& [month, factor] : growth) {
        factor -= 1.0;
    }
    return growth;
}

// ========== Composite Calculation ==========

PerformanceSummary PerformanceAnalyzer::summarize(const EquityCurve& curve,
                                                  const TrendSignals* signals,
                                                  double initial_capital) const {
    PerformanceSummary summary;
    summary.name = curve.name;

    if (curve.empty()) {
        summary.final_capital = initial_capital;
        summary.cagr = NaN;
        summary.annualized_volatility = NaN;
        summary.sharpe_ratio = NaN;
        summary.sortino_ratio = NaN;
        summary.calmar_ratio = NaN;
        return summary;
    }

    summary.final_multiplier = curve.values.back();
    summary.final_capital = initial_capital * summary.final_multiplier;
    summary.total_return = calculate_total_return(curve.values.front(), curve.values.back());
    summary.years = calculate_years(curve.dates.front(), curve.dates.back());
    summary.cagr = calculate_cagr(summary.total_return, summary.years);
    summary.max_drawdown = calculate_max_drawdown(curve.values);
    summary.annualized_volatility = calculate_volatility(curve.returns);
    summary.sharpe_ratio = calculate_sharpe_ratio(curve.returns);
    summary.sortino_ratio = calculate_sortino_ratio(curve.returns);
    summary.calmar_ratio = calculate_calmar_ratio(summary.cagr, summary.max_drawdown);

    if (signals != nullptr) {
        summary.buy_count = signals->enter_count();
        summary.sell_count = signals->exit_count();
        summary.trade_count = summary.buy_count + summary.sell_count;
    }

    return summary;
}

// ========== Helper Methods ==========

double PerformanceAnalyzer::calculate_mean(const std::vector<double>& values) const {
    if (values.empty()) {
        return NaN;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double PerformanceAnalyzer::calculate_sample_std_dev(const std::vector<double>& values,
                                                     double mean) const {
    if (values.size() < 2) {
        return NaN;
    }

    double sq_sum = 0.0;
    for (double value : values) {
        sq_sum += (value - mean) * (value - mean);
    }
    return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
}

}  // namespace backtest
}  // namespace trend_lab
