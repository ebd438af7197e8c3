// src/backtest/backtest_engine.cpp

#include "trend_lab/backtest/backtest_engine.hpp"
#include "trend_lab/core/logger.hpp"
#include "trend_lab/core/time_utils.hpp"

namespace trend_lab {
namespace backtest {

nlohmann::json BacktestResults::to_json() const {
    nlohmann::json j;
    j["config"] = config.to_json();

    j["summaries"] = {{"strategy", summaries.strategy.to_json()},
                      {"bh_traded", summaries.bh_traded.to_json()},
                      {"bh_signal", summaries.bh_signal.to_json()}};

    j["monthly_returns"] = monthly_returns;

    nlohmann::json daily = nlohmann::json::array();
    for (size_t i = 0; i < window.size(); ++i) {
        nlohmann::json row;
        row["date"] = core::format_date(window.dates[i]);
        row["signal_price"] = window.signal_prices[i];
        row["traded_price"] = window.traded_prices[i];
        if (i < signals.size()) {
            row["moving_average"] = signals.moving_average[i];
            row["signal"] = signal_to_string(signals.signals[i]);
        }
        if (i < positions.size()) {
            row["position"] = position_state_to_string(positions.states[i]);
        }
        if (i < curves.strategy.size()) {
            row["strategy"] = curves.strategy.values[i];
            row["bh_traded"] = curves.bh_traded.values[i];
            row["bh_signal"] = curves.bh_signal.values[i];
        }
        if (i < drawdowns.size()) {
            row["drawdown"] = drawdowns[i].second;
        }
        daily.push_back(std::move(row));
    }
    j["daily"] = std::move(daily);

    return j;
}

BacktestEngine::BacktestEngine(std::shared_ptr<PriceSource> source)
    : source_(std::move(source)) {
    Logger::register_component("BacktestEngine");
}

Result<PriceSeries> BacktestEngine::load_series(const std::string& symbol) const {
    if (!source_) {
        return make_error<PriceSeries>(ErrorCode::INVALID_ARGUMENT,
                                       "No price source configured", "BacktestEngine");
    }
    return source_->get_price_series(symbol);
}

Result<BacktestResults> BacktestEngine::run_backtest(const BacktestConfig& config) const {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<BacktestResults>(valid);
    }

    auto signal_result = load_series(config.signal_symbol);
    if (signal_result.is_error()) {
        ERROR("Failed to load " << config.signal_symbol << ": " << signal_result.error()->what());
        return forward_error<BacktestResults>(signal_result);
    }

    auto traded_result = load_series(config.traded_symbol);
    if (traded_result.is_error()) {
        ERROR("Failed to load " << config.traded_symbol << ": " << traded_result.error()->what());
        return forward_error<BacktestResults>(traded_result);
    }

    return run_backtest(signal_result.value(), traded_result.value(), config);
}

Result<BacktestResults> BacktestEngine::run_backtest(const PriceSeries& signal_series,
                                                     const PriceSeries& traded_series,
                                                     const BacktestConfig& config) const {
    BacktestResults results;
    results.config = config;
    if (results.config.signal_symbol.empty()) {
        results.config.signal_symbol = signal_series.symbol;
    }
    if (results.config.traded_symbol.empty()) {
        results.config.traded_symbol = traded_series.symbol;
    }

    auto valid = results.config.validate();
    if (valid.is_error()) {
        return forward_error<BacktestResults>(valid);
    }

    for (const PriceSeries* series : {&signal_series, &traded_series}) {
        if (series->empty()) {
            return make_error<BacktestResults>(ErrorCode::EMPTY_SERIES,
                                               "No prices for " + series->symbol,
                                               "BacktestEngine");
        }
        auto series_valid = validate_price_series(*series);
        if (series_valid.is_error()) {
            return forward_error<BacktestResults>(series_valid);
        }
    }

    INFO("Running " << results.config.signal_symbol << " -> " << results.config.traded_symbol
                    << " from " << core::format_date(config.start_date) << " to "
                    << core::format_date(config.end_date) << " (W=" << config.window_length
                    << ", " << moving_average_type_to_string(config.moving_average_type) << ", "
                    << initial_policy_to_string(config.initial_policy) << ")");

    // Align
    PriceAligner aligner(config.min_buffer_days);
    auto window_result = aligner.align(signal_series, traded_series, config.start_date,
                                       config.end_date, config.window_length);
    if (window_result.is_error()) {
        ERROR("Alignment failed: " << window_result.error()->to_string());
        return forward_error<BacktestResults>(window_result);
    }
    results.window = window_result.take_value();

    // Signals
    TrendSignalGenerator generator(config.moving_average_type);
    auto signals_result = generator.generate(results.window, config.window_length);
    if (signals_result.is_error()) {
        return forward_error<BacktestResults>(signals_result);
    }
    results.signals = signals_result.take_value();

    // Positions
    PositionTracker tracker(config.initial_policy);
    auto positions_result = tracker.track(results.signals);
    if (positions_result.is_error()) {
        return forward_error<BacktestResults>(positions_result);
    }
    results.positions = positions_result.take_value();

    // Equity
    EquityCurveSimulator simulator;
    auto curves_result = simulator.simulate(results.window, results.positions);
    if (curves_result.is_error()) {
        return forward_error<BacktestResults>(curves_result);
    }
    results.curves = curves_result.take_value();

    // Metrics
    PerformanceAnalyzer analyzer;
    results.summaries.strategy =
        analyzer.summarize(results.curves.strategy, &results.signals, config.initial_capital);
    results.summaries.bh_traded =
        analyzer.summarize(results.curves.bh_traded, nullptr, config.initial_capital);
    results.summaries.bh_signal =
        analyzer.summarize(results.curves.bh_signal, nullptr, config.initial_capital);
    results.monthly_returns = analyzer.calculate_monthly_returns(results.curves.strategy);
    results.drawdowns = analyzer.calculate_drawdowns(results.curves.strategy);

    INFO("Backtest complete: " << results.window.size() << " days, "
                               << results.summaries.strategy.trade_count << " signals, "
                               << "strategy total return " << results.summaries.strategy.total_return);

    return results;
}

Result<std::vector<momentum::MomentumEntry>> BacktestEngine::rank_momentum(
    const std::optional<std::vector<std::string>>& symbols,
    const momentum::MomentumConfig& config) const {
    return rank_momentum(symbols, config, core::today());
}

Result<std::vector<momentum::MomentumEntry>> BacktestEngine::rank_momentum(
    const std::optional<std::vector<std::string>>& symbols,
    const momentum::MomentumConfig& config, const Timestamp& as_of) const {
    if (!source_) {
        return make_error<std::vector<momentum::MomentumEntry>>(
            ErrorCode::INVALID_ARGUMENT, "No price source configured", "BacktestEngine");
    }

    std::vector<std::string> universe_symbols;
    if (symbols) {
        universe_symbols = *symbols;
    } else {
        auto available = source_->list_available_symbols();
        if (available.is_error()) {
            ERROR("Failed to list symbols: " << available.error()->what());
            return forward_error<std::vector<momentum::MomentumEntry>>(available);
        }
        universe_symbols.assign(available.value().begin(), available.value().end());
    }

    std::map<std::string, PriceSeries> universe;
    for (const auto& symbol : universe_symbols) {
        auto series = source_->get_price_series(symbol);
        if (series.is_error()) {
            DEBUG("Excluding " << symbol << " from momentum ranking: "
                               << series.error()->to_string());
            continue;
        }
        universe.emplace(symbol, series.take_value());
    }

    momentum::MomentumRanker ranker(config);
    auto ranking = ranker.rank(universe, as_of);
    if (ranking.is_ok()) {
        INFO("Ranked " << ranking.value().size() << " of " << universe_symbols.size()
                       << " symbols as of " << core::format_date(as_of));
    }
    return ranking;
}

}  // namespace backtest
}  // namespace trend_lab
