#include <gtest/gtest.h>
#include <cmath>
#include "core/test_base.hpp"
#include "trend_lab/backtest/equity_curve_simulator.hpp"
#include "trend_lab/backtest/performance_analyzer.hpp"

using namespace trend_lab;
using namespace trend_lab::backtest;
using namespace trend_lab::testing;

class PerformanceAnalyzerTest : public TestBase {
protected:
    EquityCurve make_curve(const Timestamp& first, const std::vector<double>& values) const {
        EquityCurve curve;
        curve.name = "strategy";
        for (size_t i = 0; i < values.size(); ++i) {
            curve.dates.push_back(core::add_days(first, static_cast<int64_t>(i)));
        }
        curve.values = values;
        curve.returns = EquityCurveSimulator::percentage_change(values);
        return curve;
    }

    PerformanceAnalyzer analyzer_;
};

TEST_F(PerformanceAnalyzerTest, ReturnsAndCagr) {
    EXPECT_NEAR(analyzer_.calculate_total_return(1.0, 1.25), 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(analyzer_.calculate_years(core::make_date(2023, 1, 1),
                                               core::make_date(2024, 1, 1)),
                     1.0);
    EXPECT_NEAR(analyzer_.calculate_cagr(0.21, 2.0), 0.1, 1e-12);
    EXPECT_TRUE(std::isnan(analyzer_.calculate_cagr(0.1, 0.0)));
    EXPECT_TRUE(std::isnan(analyzer_.calculate_cagr(0.1, -1.0)));
}

TEST_F(PerformanceAnalyzerTest, SampleStatistics) {
    std::vector<double> returns{0.0, 0.1, -0.1, 0.1};
    double mean = 0.025;
    double stdev = std::sqrt(0.0275 / 3.0);

    EXPECT_NEAR(analyzer_.calculate_volatility(returns), stdev * std::sqrt(252.0), 1e-12);
    EXPECT_NEAR(analyzer_.calculate_sharpe_ratio(returns), mean / stdev * std::sqrt(252.0),
                1e-10);
    // A single negative return has no sample deviation
    EXPECT_TRUE(std::isnan(analyzer_.calculate_sortino_ratio(returns)));
}

TEST_F(PerformanceAnalyzerTest, SortinoUsesNegativeReturnsOnly) {
    std::vector<double> returns{0.0, -0.1, 0.05, -0.2, 0.1};
    double mean = -0.03;
    double downside = std::sqrt(0.005);

    EXPECT_NEAR(analyzer_.calculate_sortino_ratio(returns),
                mean / downside * std::sqrt(252.0), 1e-10);

    // Two identical losses have zero deviation
    EXPECT_TRUE(std::isnan(analyzer_.calculate_sortino_ratio({0.0, -0.1, -0.1, 0.2})));
}

TEST_F(PerformanceAnalyzerTest, UndefinedStatistics) {
    EXPECT_TRUE(std::isnan(analyzer_.calculate_volatility({0.0})));
    EXPECT_TRUE(std::isnan(analyzer_.calculate_sharpe_ratio({0.0})));
    EXPECT_TRUE(std::isnan(analyzer_.calculate_sortino_ratio({})));

    std::vector<double> flat{0.0, 0.0, 0.0};
    EXPECT_DOUBLE_EQ(analyzer_.calculate_volatility(flat), 0.0);
    EXPECT_TRUE(std::isnan(analyzer_.calculate_sharpe_ratio(flat)));

    EXPECT_TRUE(std::isnan(analyzer_.calculate_calmar_ratio(0.1, 0.0)));
    EXPECT_NEAR(analyzer_.calculate_calmar_ratio(0.1, 0.2), 0.5, 1e-12);
}

TEST_F(PerformanceAnalyzerTest, Drawdowns) {
    auto curve = make_curve(core::make_date(2024, 1, 1), {1.0, 1.2, 0.9, 1.5, 1.2});

    EXPECT_NEAR(analyzer_.calculate_max_drawdown(curve.values), 0.25, 1e-12);

    auto drawdowns = analyzer_.calculate_drawdowns(curve);
    ASSERT_EQ(drawdowns.size(), 5u);
    EXPECT_EQ(drawdowns[0].first, curve.dates[0]);
    EXPECT_DOUBLE_EQ(drawdowns[0].second, 0.0);
    EXPECT_DOUBLE_EQ(drawdowns[1].second, 0.0);
    EXPECT_NEAR(drawdowns[2].second, 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(drawdowns[3].second, 0.0);
    EXPECT_NEAR(drawdowns[4].second, 0.2, 1e-12);

    EXPECT_DOUBLE_EQ(analyzer_.calculate_max_drawdown({1.0, 1.1, 1.2}), 0.0);
}

TEST_F(PerformanceAnalyzerTest, DrawdownStaysInUnitInterval) {
    auto walk = make_walk(1000, 100.0, 21);
    std::vector<double> values;
    for (double price : walk) {
        values.push_back(price / walk.front());
    }

    double mdd = analyzer_.calculate_max_drawdown(values);
    EXPECT_GE(mdd, 0.0);
    EXPECT_LE(mdd, 1.0);
    for (const auto& [date, dd] : analyzer_.calculate_drawdowns(
             make_curve(core::make_date(2020, 1, 1), values))) {
        EXPECT_GE(dd, 0.0);
        EXPECT_LE(dd, mdd + 1e-15);
    }
}

TEST_F(PerformanceAnalyzerTest, MonthlyReturnsCompoundWithinMonth) {
    auto curve = make_curve(core::make_date(2024, 1, 30), {1.0, 1.1, 1.21, 1.089});

    auto monthly = analyzer_.calculate_monthly_returns(curve);
    ASSERT_EQ(monthly.size(), 2u);
    EXPECT_NEAR(monthly.at("2024-01"), 0.1, 1e-12);
    EXPECT_NEAR(monthly.at("2024-02"), -0.01, 1e-12);
}

TEST_F(PerformanceAnalyzerTest, SummaryWithSignals) {
    auto curve = make_curve(core::make_date(2024, 1, 1), {1.0, 1.1, 0.99, 1.089});
    TrendSignals signals;
    signals.prices = {1, 1, 1, 1};
    signals.moving_average = {1, 1, 1, 1};
    signals.signals = {Signal::NONE, Signal::ENTER, Signal::EXIT, Signal::ENTER};

    auto summary = analyzer_.summarize(curve, &signals, 10000.0);
    EXPECT_EQ(summary.name, "strategy");
    EXPECT_NEAR(summary.final_multiplier, 1.089, 1e-12);
    EXPECT_NEAR(summary.final_capital, 10890.0, 1e-8);
    EXPECT_NEAR(summary.total_return, 0.089, 1e-12);
    EXPECT_NEAR(summary.years, 3.0 / 365.0, 1e-15);
    EXPECT_NEAR(summary.cagr, std::pow(1.089, 365.0 / 3.0) - 1.0, 1e-6);
    EXPECT_NEAR(summary.max_drawdown, 0.1, 1e-12);
    EXPECT_NEAR(summary.calmar_ratio, summary.cagr / summary.max_drawdown, 1e-9);
    EXPECT_EQ(summary.trade_count, 3);
    EXPECT_EQ(summary.buy_count, 2);
    EXPECT_EQ(summary.sell_count, 1);

    auto buy_and_hold = analyzer_.summarize(curve, nullptr, 10000.0);
    EXPECT_EQ(buy_and_hold.trade_count, 0);
}

TEST_F(PerformanceAnalyzerTest, DegenerateCurves) {
    auto single = analyzer_.summarize(make_curve(core::make_date(2024, 1, 1), {1.0}), nullptr,
                                      10000.0);
    EXPECT_DOUBLE_EQ(single.total_return, 0.0);
    EXPECT_TRUE(std::isnan(single.cagr));
    EXPECT_TRUE(std::isnan(single.annualized_volatility));
    EXPECT_TRUE(std::isnan(single.sharpe_ratio));
    EXPECT_TRUE(std::isnan(single.sortino_ratio));
    EXPECT_TRUE(std::isnan(single.calmar_ratio));

    auto empty = analyzer_.summarize(EquityCurve{}, nullptr, 500.0);
    EXPECT_DOUBLE_EQ(empty.final_capital, 500.0);
    EXPECT_TRUE(std::isnan(empty.sharpe_ratio));
}

TEST_F(PerformanceAnalyzerTest, SummaryJsonWritesNullForUndefined) {
    auto flat = analyzer_.summarize(make_curve(core::make_date(2024, 1, 1), {1.0, 1.0, 1.0}),
                                    nullptr, 10000.0);
    ASSERT_TRUE(std::isnan(flat.sharpe_ratio));

    auto parsed = nlohmann::json::parse(flat.to_json().dump());
    EXPECT_TRUE(parsed["sharpe_ratio"].is_null());
    EXPECT_TRUE(parsed["calmar_ratio"].is_null());
    EXPECT_DOUBLE_EQ(parsed["final_capital"].get<double>(), 10000.0);
    EXPECT_EQ(parsed["trade_count"].get<int>(), 0);
}
