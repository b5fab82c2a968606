#include "backtester.hpp"
#include "strategy_factory.hpp"
#include "indicator_frame.hpp"
#include "config_json.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

namespace backtester {

    Backtester::Backtester(BacktestConfig config)
        : config_(config)
    {
        config_.validate();
        core::logging::getLogger()->debug("Backtester initialized with capital: {}", config_.initial_capital);
    }

    BacktestResult Backtester::run(const core::PriceSeries& series,
                                   const strategy_engine::StrategyConfig& strategy_config) const
    {
        auto logger = core::logging::getLogger();
        logger->info("========================================================");
        logger->info("Starting Backtest Run: {}", strategy_config.strategy_name);
        logger->info("========================================================");

        // 1. Validate everything up front
        core::utils::validatePriceSeries(series);
        strategy_config.validate();
        logger->info("Period: {} to {} ({} bars)",
                     core::utils::timestampToString(series.front().timestamp),
                     core::utils::timestampToString(series.back().timestamp),
                     series.size());

        // 2. Indicators and signals
        auto generator = strategy_engine::StrategyFactory::createSignalGenerator(strategy_config);
        strategy_engine::IndicatorFrame frame = strategy_engine::buildIndicatorFrame(series, strategy_config);
        strategy_engine::SignalFrame signals = generator->generate(std::move(frame));

        // 3. Simulation
        SimulationEngine engine(config_);
        SimulationResult simulation = engine.run(signals);

        // 4. Metrics
        MetricsCalculator calculator(config_);
        PerformanceReport report = calculator.calculate(simulation.equity_curve, simulation.trades,
                                                        simulation.total_executions);

        logger->info("========================================================");
        logger->info("Backtest Run Completed for Strategy '{}'", strategy_config.strategy_name);
        logger->info("========================================================");

        BacktestResult result;
        result.signals = std::move(signals);
        result.equity_curve = std::move(simulation.equity_curve);
        result.trades = std::move(simulation.trades);
        result.open_trade = std::move(simulation.open_trade);
        result.final_cash = simulation.final_cash;
        result.report = report;
        return result;
    }

    RunConfig Backtester::parseRunConfig(const json& config) {
        strategy_engine::config_json::requireObject(config, "Run config");

        RunConfig run_config;
        run_config.strategy = strategy_engine::StrategyFactory::parseConfig(config);

        auto it = config.find("backtest");
        if (it != config.end()) {
            run_config.backtest = BacktestConfig::fromJson(*it);
        }
        return run_config;
    }

} // namespace backtester
