#include "simulation_engine.hpp"
#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace backtester {

SimulationEngine::SimulationEngine(BacktestConfig config)
    : config_(config)
{
    config_.validate();
}

SimulationResult SimulationEngine::run(const strategy_engine::SignalFrame& frame) const {
    auto logger = core::logging::getLogger();

    const core::PriceSeries& bars = frame.indicators.bars;
    core::utils::validatePriceSeries(bars);
    if (frame.signals.size() != bars.size()) {
        throw core::InvalidInputException("signals",
            fmt::format("Signal count ({}) does not match bar count ({}).", frame.signals.size(), bars.size()));
    }

    logger->info("Simulating {} bars with capital {:.2f}, commission {}.",
                 bars.size(), config_.initial_capital, config_.commission_rate);

    Portfolio portfolio(config_.initial_capital, config_.commission_rate);
    SimulationResult result;
    result.equity_curve.reserve(bars.size());

    for (size_t i = 0; i < bars.size(); ++i) {
        const core::PriceBar& bar = bars[i];
        const strategy_engine::SignalPoint& signal = frame.signals[i];

        // --- 1. Mark to market ---
        result.equity_curve.push_back(portfolio.markToMarket(bar.timestamp, bar.close));

        // --- 2. Execute ---
        if (!portfolio.isLong() && signal.buy_signal) {
            portfolio.buy(bar.timestamp, bar.close);
        } else if (portfolio.isLong() && signal.sell_signal) {
            portfolio.sell(bar.timestamp, bar.close);
        } else if (signal.buy_signal || signal.sell_signal) {
            logger->debug("Bar {}: signal does not match position, ignored.", i);
        }
    }

    if (portfolio.isLong() && config_.liquidate_at_end) {
        const core::PriceBar& last = bars.back();
        logger->info("Liquidating open position at the last close {:.2f}.", last.close);
        portfolio.sell(last.timestamp, last.close);
    }

    result.trades = portfolio.getTradeLog();
    result.open_trade = portfolio.getOpenTrade();
    result.total_executions = portfolio.getTotalExecutions();
    result.final_cash = portfolio.getCash();

    if (result.open_trade) {
        logger->info("Simulation finished with an open position of {} shares.", result.open_trade->shares);
    }
    logger->info("Simulation finished: {} closed trades, {} executions, final value {:.2f}.",
                 result.trades.size(), result.total_executions, result.equity_curve.back().portfolio_value);
    return result;
}

} // namespace backtester
