#include <gtest/gtest.h>
#include <vector>

#include "test_base.hpp"
#include "simulation_engine.hpp"
#include "exceptions.hpp"

using namespace backtester;
using strategy_engine::SignalFrame;
using strategy_engine::SignalPoint;

class SimulationEngineTest : public ::testing::Test {
protected:
    // Builds a frame with explicit buy / sell bars; position_state is not read by the engine
    SignalFrame makeFrame(const std::vector<double>& closes,
                          const std::vector<size_t>& buys,
                          const std::vector<size_t>& sells) {
        SignalFrame frame;
        frame.indicators.bars = backtest_testing::makeSeries(closes);
        frame.signals.resize(closes.size());
        for (size_t i : buys) frame.signals[i].buy_signal = true;
        for (size_t i : sells) frame.signals[i].sell_signal = true;
        return frame;
    }

    BacktestConfig noCommission(double capital = 10000.0) {
        BacktestConfig config;
        config.initial_capital = capital;
        config.commission_rate = 0.0;
        return config;
    }

    const std::vector<double> closes_{100.0, 100.0, 110.0, 120.0, 90.0};
};

TEST_F(SimulationEngineTest, MarksBeforeTrading) {
    SimulationEngine engine(noCommission());
    SimulationResult result = engine.run(makeFrame(closes_, {1}, {3}));

    ASSERT_EQ(result.equity_curve.size(), closes_.size());
    const std::vector<double> expected{10000.0, 10000.0, 11000.0, 12000.0, 12000.0};
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(result.equity_curve[i].portfolio_value, expected[i], 1e-9) << "bar " << i;
    }
    // Bar 1 is marked while still flat, bar 3 while still long
    EXPECT_EQ(result.equity_curve[1].shares_held, 0);
    EXPECT_EQ(result.equity_curve[3].shares_held, 100);
    EXPECT_EQ(result.equity_curve[4].shares_held, 0);

    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_NEAR(result.trades[0].pnl, 2000.0, 1e-9);
    EXPECT_NEAR(result.trades[0].return_pct, 0.2, 1e-12);
    EXPECT_EQ(result.total_executions, 2);
    EXPECT_FALSE(result.open_trade.has_value());
}

TEST_F(SimulationEngineTest, EquityIsCashPlusHoldings) {
    SimulationEngine engine(BacktestConfig{});
    SimulationResult result = engine.run(makeFrame(closes_, {0}, {2}));
    for (size_t i = 0; i < result.equity_curve.size(); ++i) {
        const core::EquityPoint& point = result.equity_curve[i];
        EXPECT_GE(point.cash, 0.0);
        EXPECT_DOUBLE_EQ(point.mark_price, closes_[i]);
        EXPECT_NEAR(point.portfolio_value, point.cash + point.shares_held * point.mark_price, 1e-9);
    }
}

TEST_F(SimulationEngineTest, SignalsAgainstPositionAreIgnored) {
    SimulationEngine engine(noCommission());
    // Sell while flat, a second buy while long
    SimulationResult result = engine.run(makeFrame(closes_, {1, 2}, {0, 3}));
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(result.trades[0].entry_price, 100.0);
    EXPECT_DOUBLE_EQ(*result.trades[0].exit_price, 120.0);
    EXPECT_EQ(result.total_executions, 2);
}

TEST_F(SimulationEngineTest, UnaffordableBuyLeavesPortfolioFlat) {
    SimulationEngine engine(noCommission(50.0));
    SimulationResult result = engine.run(makeFrame(closes_, {1}, {3}));
    EXPECT_TRUE(result.trades.empty());
    EXPECT_FALSE(result.open_trade.has_value());
    EXPECT_EQ(result.total_executions, 0);
    for (const auto& point : result.equity_curve) {
        EXPECT_DOUBLE_EQ(point.portfolio_value, 50.0);
    }
}

TEST_F(SimulationEngineTest, OpenPositionAtEnd) {
    SimulationEngine engine(noCommission());
    SimulationResult result = engine.run(makeFrame(closes_, {1}, {}));
    EXPECT_TRUE(result.trades.empty());
    ASSERT_TRUE(result.open_trade.has_value());
    EXPECT_TRUE(result.open_trade->isOpen());
    EXPECT_EQ(result.open_trade->shares, 100);
    EXPECT_EQ(result.total_executions, 1);
    EXPECT_DOUBLE_EQ(result.equity_curve.back().portfolio_value, 9000.0);
}

TEST_F(SimulationEngineTest, LiquidateAtEndClosesPosition) {
    BacktestConfig config = noCommission();
    config.liquidate_at_end = true;
    SimulationEngine engine(config);
    SimulationResult result = engine.run(makeFrame(closes_, {1}, {}));

    EXPECT_FALSE(result.open_trade.has_value());
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_DOUBLE_EQ(*result.trades[0].exit_price, 90.0);
    EXPECT_NEAR(result.trades[0].pnl, -1000.0, 1e-9);
    EXPECT_EQ(result.total_executions, 2);
    ASSERT_EQ(result.equity_curve.size(), closes_.size());
    EXPECT_DOUBLE_EQ(result.equity_curve.back().portfolio_value, 9000.0);
}

TEST_F(SimulationEngineTest, FinalCashIncludesLiquidationCommission) {
    BacktestConfig config = noCommission();
    config.commission_rate = 0.001;
    config.liquidate_at_end = true;
    SimulationResult result = SimulationEngine(config).run(makeFrame(closes_, {1}, {}));

    // 99 shares bought at 100 leave 90.1; the sale at 90 returns 99 * 90 * 0.999
    ASSERT_EQ(result.trades.size(), 1u);
    EXPECT_NEAR(result.equity_curve.back().portfolio_value, 8999.1, 1e-6);
    EXPECT_NEAR(result.final_cash, 8991.19, 1e-6);
    EXPECT_LT(result.final_cash, result.equity_curve.back().portfolio_value);

    // Without liquidation the remaining cash is what the last point shows
    config.liquidate_at_end = false;
    SimulationResult held = SimulationEngine(config).run(makeFrame(closes_, {1}, {}));
    ASSERT_TRUE(held.open_trade.has_value());
    EXPECT_NEAR(held.final_cash, 90.1, 1e-6);
    EXPECT_DOUBLE_EQ(held.final_cash, held.equity_curve.back().cash);
}

TEST_F(SimulationEngineTest, RejectsBadInput) {
    SimulationEngine engine{BacktestConfig{}};

    SignalFrame short_signals = makeFrame(closes_, {}, {});
    short_signals.signals.pop_back();
    try {
        engine.run(short_signals);
        FAIL() << "Expected InvalidInputException";
    } catch (const core::InvalidInputException& e) {
        EXPECT_EQ(e.field(), "signals");
    }

    SignalFrame empty;
    EXPECT_THROW(engine.run(empty), core::InvalidInputException);

    SignalFrame bad_price = makeFrame({100.0, -1.0, 100.0}, {}, {});
    EXPECT_THROW(engine.run(bad_price), core::InvalidInputException);
}

TEST_F(SimulationEngineTest, RejectsInvalidConfig) {
    BacktestConfig config;
    config.commission_rate = 1.0;
    EXPECT_THROW(SimulationEngine{config}, core::InvalidInputException);
    config = BacktestConfig{};
    config.initial_capital = -5.0;
    EXPECT_THROW(SimulationEngine{config}, core::InvalidInputException);
}
