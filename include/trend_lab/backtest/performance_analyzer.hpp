// include/trend_lab/backtest/performance_analyzer.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>
#include "trend_lab/backtest/equity_curve_simulator.hpp"
#include "trend_lab/backtest/trend_signal_generator.hpp"
#include "trend_lab/core/types.hpp"

namespace trend_lab {
namespace backtest {

/**
 * @brief Risk/return figures of one equity curve
 *
 * Undefined figures (e.g. Sharpe of a curve that never moves) are quiet NaN.
 */
struct PerformanceSummary {
    std::string name;
    double final_multiplier{1.0};
    double final_capital{0.0};
    double total_return{0.0};
    double cagr{0.0};
    double max_drawdown{0.0};
    double annualized_volatility{0.0};
    double sharpe_ratio{0.0};
    double sortino_ratio{0.0};
    double calmar_ratio{0.0};
    double years{0.0};
    int trade_count{0};  // Dates carrying an ENTER or EXIT signal
    int buy_count{0};
    int sell_count{0};

    nlohmann::json to_json() const;
};

/**
 * @brief Pure stateless calculation component for performance metrics
 *
 * Key responsibilities:
 * - Return calculations (total, CAGR)
 * - Risk-adjusted metrics (Sharpe, Sortino, Calmar)
 * - Drawdown calculations
 * - Monthly returns aggregation
 *
 * All methods are const, never log and never throw. Statistics use the
 * sample standard deviation and annualize with sqrt(252).
 */
class PerformanceAnalyzer {
public:
    static constexpr double TRADING_DAYS_PER_YEAR = 252.0;
    static constexpr double DAYS_PER_YEAR = 365.0;

    PerformanceAnalyzer() = default;

    // ========== Return Calculations ==========

    /**
     * @brief Total return as decimal (0.10 = 10%)
     */
    double calculate_total_return(double start_value, double end_value) const;

    /**
     * @brief Calendar years between two dates (days / 365)
     */
    double calculate_years(const Timestamp& first_date, const Timestamp& last_date) const;

    /**
     * @brief Compound annual growth rate, NaN if years <= 0
     */
    double calculate_cagr(double total_return, double years) const;

    // ========== Risk-Adjusted Return Metrics ==========

    /**
     * @brief mean / stdev * sqrt(252), NaN if stdev is 0 or fewer than two returns
     */
    double calculate_sharpe_ratio(const std::vector<double>& returns) const;

    /**
     * @brief mean / stdev(negative returns) * sqrt(252), NaN if that stdev is undefined or 0
     */
    double calculate_sortino_ratio(const std::vector<double>& returns) const;

    /**
     * @brief CAGR / max drawdown, NaN if max drawdown is 0
     */
    double calculate_calmar_ratio(double cagr, double max_drawdown) const;

    // ========== Volatility Metrics ==========

    /**
     * @brief Annualized volatility, NaN with fewer than two returns
     */
    double calculate_volatility(const std::vector<double>& returns) const;

    // ========== Drawdown Metrics ==========

    /**
     * @brief Drawdown 1 - E[t] / max(E[0..t]) for every date
     */
    std::vector<std::pair<Timestamp, double>> calculate_drawdowns(const EquityCurve& curve) const;

    /**
     * @brief Maximum drawdown as a positive fraction
     */
    double calculate_max_drawdown(const std::vector<double>& values) const;

    // ========== Aggregations ==========

    /**
     * @brief Compounded return per calendar month, keyed "YYYY-MM"
     */
    std::map<std::string, double> calculate_monthly_returns(const EquityCurve& curve) const;

    // ========== Composite Calculation ==========

    /**
     * @brief Compute every metric of a curve
     * @param curve Equity curve with its daily return series
     * @param signals Signal stream driving the curve, nullptr for buy and hold
     * @param initial_capital Capital scaled by the final multiplier
     */
    PerformanceSummary summarize(const EquityCurve& curve, const TrendSignals* signals,
                                 double initial_capital) const;

private:
    double calculate_mean(const std::vector<double>& values) const;
    double calculate_sample_std_dev(const std::vector<double>& values, double mean) const;
};

}  // namespace backtest
}  // namespace trend_lab
