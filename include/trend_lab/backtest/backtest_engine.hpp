// include/trend_lab/backtest/backtest_engine.hpp

#pragma once

#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "trend_lab/backtest/backtest_config.hpp"
#include "trend_lab/backtest/equity_curve_simulator.hpp"
#include "trend_lab/backtest/performance_analyzer.hpp"
#include "trend_lab/backtest/position_tracker.hpp"
#include "trend_lab/backtest/price_aligner.hpp"
#include "trend_lab/backtest/trend_signal_generator.hpp"
#include "trend_lab/core/error.hpp"
#include "trend_lab/data/price_source.hpp"
#include "trend_lab/momentum/momentum_ranker.hpp"

namespace trend_lab {
namespace backtest {

/**
 * @brief Summaries of the three curves of a run
 */
struct PerformanceSummaries {
    PerformanceSummary strategy;
    PerformanceSummary bh_traded;
    PerformanceSummary bh_signal;
};

/**
 * @brief Everything produced by a single backtest run
 */
struct BacktestResults {
    BacktestConfig config;
    AlignedWindow window;
    TrendSignals signals;
    PositionSeries positions;
    EquityCurves curves;
    PerformanceSummaries summaries;

    // Strategy curve only
    std::map<std::string, double> monthly_returns;
    std::vector<std::pair<Timestamp, double>> drawdowns;

    nlohmann::json to_json() const;
};

/**
 * @brief Entry point for trend-filter backtests and momentum rankings
 *
 * Runs are pure functions of their inputs: the engine holds no state besides
 * its price source, so concurrent runs on independent inputs are safe.
 */
class BacktestEngine {
public:
    /**
     * @param source Price provider; may be null when only pre-loaded series are used
     */
    explicit BacktestEngine(std::shared_ptr<PriceSource> source = nullptr);

    /**
     * @brief Load both series from the price source and run the backtest
     *
     * Load errors (NOT_FOUND, EMPTY_SERIES, ...) are returned unchanged.
     */
    Result<BacktestResults> run_backtest(const BacktestConfig& config) const;

    /**
     * @brief Run the backtest on already-loaded series
     *
     * Empty symbols in the config are taken from the series.
     */
    Result<BacktestResults> run_backtest(const PriceSeries& signal_series,
                                         const PriceSeries& traded_series,
                                         const BacktestConfig& config) const;

    /**
     * @brief Rank instruments by trailing momentum
     * @param symbols Universe to rank; every symbol of the source if nullopt.
     *                Symbols that fail to load are left out.
     */
    Result<std::vector<momentum::MomentumEntry>> rank_momentum(
        const std::optional<std::vector<std::string>>& symbols,
        const momentum::MomentumConfig& config, const Timestamp& as_of) const;

    Result<std::vector<momentum::MomentumEntry>> rank_momentum(
        const std::optional<std::vector<std::string>>& symbols = std::nullopt,
        const momentum::MomentumConfig& config = momentum::MomentumConfig{}) const;

private:
    std::shared_ptr<PriceSource> source_;

    Result<PriceSeries> load_series(const std::string& symbol) const;
};

}  // namespace backtest
}  // namespace trend_lab
