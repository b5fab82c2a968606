#pragma once

#include <string>
#include <vector>
#include <optional>

#include "datatypes.hpp"
#include "strategy_config.hpp"
#include "signal_generator.hpp"
#include "backtest_config.hpp"
#include "simulation_engine.hpp"
#include "metrics_calculator.hpp"

namespace backtester {

    // Everything one run produces
    struct BacktestResult {
        strategy_engine::SignalFrame signals;
        core::EquityCurve equity_curve;
        std::vector<core::Trade> trades;
        std::optional<core::Trade> open_trade;
        double final_cash = 0.0; // See SimulationResult::final_cash
        PerformanceReport report;
    };

    // Parsed form of a full JSON run configuration
    struct RunConfig {
        strategy_engine::StrategyConfig strategy;
        BacktestConfig backtest;
    };

    class Backtester {
    public:
        explicit Backtester(BacktestConfig config = BacktestConfig{});

        // validate -> indicators -> signals -> simulation -> metrics.
        // Throws core::InvalidInputException before any simulation on bad input.
        BacktestResult run(const core::PriceSeries& series,
                           const strategy_engine::StrategyConfig& strategy_config) const;

        const BacktestConfig& getConfig() const { return config_; }

        // Splits a run configuration document into its strategy part and its
        // optional "backtest" object
        static RunConfig parseRunConfig(const json& config);

    private:
        BacktestConfig config_;
    };

} // namespace backtester
