#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "test_base.hpp"
#include "signal_generator.hpp"
#include "strategy_factory.hpp"
#include "indicator_frame.hpp"
#include "rule.hpp"
#include "exceptions.hpp"

using namespace strategy_engine;
using namespace backtest_testing;

namespace {

    class AlwaysCondition : public ICondition {
    public:
        bool evaluate(const MarketDataSnapshot&) const override { return true; }
        std::string describe() const override { return "ALWAYS"; }
    };

    std::vector<std::unique_ptr<IRule>> singleRule(const std::string& name, core::SignalAction action) {
        std::vector<std::unique_ptr<IRule>> rules;
        rules.push_back(std::make_unique<Rule>(name, std::make_unique<AlwaysCondition>(), action));
        return rules;
    }

    std::vector<size_t> buyBars(const SignalFrame& frame) {
        std::vector<size_t> bars;
        for (size_t i = 0; i < frame.size(); ++i) {
            if (frame.signals[i].buy_signal) bars.push_back(i);
        }
        return bars;
    }

    std::vector<size_t> sellBars(const SignalFrame& frame) {
        std::vector<size_t> bars;
        for (size_t i = 0; i < frame.size(); ++i) {
            if (frame.signals[i].sell_signal) bars.push_back(i);
        }
        return bars;
    }

} // namespace

class SignalGeneratorTest : public ::testing::Test {
protected:
    SignalFrame run(const std::vector<double>& closes, const StrategyConfig& config) {
        auto generator = StrategyFactory::createSignalGenerator(config);
        return generator->generate(buildIndicatorFrame(makeSeries(closes), config));
    }

    // Buy only from FLAT, sell only from LONG, never both on one bar
    void expectConsistentStates(const SignalFrame& frame) {
        core::PositionState previous = core::PositionState::Flat;
        for (size_t i = 0; i < frame.size(); ++i) {
            const SignalPoint& point = frame.signals[i];
            EXPECT_FALSE(point.buy_signal && point.sell_signal) << "bar " << i;
            if (point.buy_signal) {
                EXPECT_EQ(previous, core::PositionState::Flat) << "bar " << i;
                EXPECT_EQ(point.position_state, core::PositionState::Long) << "bar " << i;
            } else if (point.sell_signal) {
                EXPECT_EQ(previous, core::PositionState::Long) << "bar " << i;
                EXPECT_EQ(point.position_state, core::PositionState::Flat) << "bar " << i;
            } else {
                EXPECT_EQ(point.position_state, previous) << "bar " << i;
            }
            previous = point.position_state;
        }
    }
};

TEST_F(SignalGeneratorTest, DefaultAndNeedsBothEntryConditions) {
    // RSI is oversold from bar 13 on, but MACD never crosses above its signal
    StrategyConfig config;
    SignalFrame frame = run(linearDecline(), config);
    ASSERT_EQ(frame.size(), 60u);
    EXPECT_TRUE(buyBars(frame).empty());
    EXPECT_TRUE(sellBars(frame).empty());
    expectConsistentStates(frame);
}

TEST_F(SignalGeneratorTest, OrEntersOnRsiAlone) {
    StrategyConfig config;
    config.combine_logic = CombineLogic::Or;
    SignalFrame frame = run(linearDecline(), config);
    EXPECT_EQ(buyBars(frame), (std::vector<size_t>{13}));
    EXPECT_TRUE(sellBars(frame).empty());
    EXPECT_EQ(frame.signals.back().position_state, core::PositionState::Long);
    expectConsistentStates(frame);
}

TEST_F(SignalGeneratorTest, RsiOnlyRoundTrip) {
    StrategyConfig config;
    config.indicators = {IndicatorToggle::Rsi};
    SignalFrame frame = run(fallRiseFall(), config);
    EXPECT_EQ(buyBars(frame), (std::vector<size_t>{13}));
    EXPECT_EQ(sellBars(frame), (std::vector<size_t>{23}));
    ASSERT_TRUE(frame.indicators.rsi[23].has_value());
    EXPECT_GT(*frame.indicators.rsi[23], 70.0);
    EXPECT_LE(*frame.indicators.rsi[22], 70.0);
    expectConsistentStates(frame);
}

TEST_F(SignalGeneratorTest, MovingAverageRule) {
    StrategyConfig config;
    config.indicators = {IndicatorToggle::MovingAverage};
    SignalFrame frame = run(riseThenFall(), config);
    EXPECT_EQ(buyBars(frame), (std::vector<size_t>{19}));
    EXPECT_EQ(sellBars(frame), (std::vector<size_t>{33}));
    expectConsistentStates(frame);
}

TEST_F(SignalGeneratorTest, FlatMarketProducesNoSignals) {
    StrategyConfig config;
    config.indicators = {IndicatorToggle::Rsi, IndicatorToggle::Macd, IndicatorToggle::MovingAverage};
    config.combine_logic = CombineLogic::Or;
    SignalFrame frame = run(flat(), config);
    EXPECT_TRUE(buyBars(frame).empty());
    EXPECT_TRUE(sellBars(frame).empty());
    for (const auto& point : frame.signals) {
        EXPECT_EQ(point.position_state, core::PositionState::Flat);
    }
}

TEST_F(SignalGeneratorTest, AlternatesWhenRulesAlwaysFire) {
    SignalGenerator generator("Always",
                              singleRule("In", core::SignalAction::EnterLong),
                              singleRule("Out", core::SignalAction::ExitLong));
    StrategyConfig config;
    SignalFrame frame = generator.generate(buildIndicatorFrame(makeSeries(flat(6)), config));
    EXPECT_EQ(buyBars(frame), (std::vector<size_t>{0, 2, 4}));
    EXPECT_EQ(sellBars(frame), (std::vector<size_t>{1, 3, 5}));
    expectConsistentStates(frame);
}

TEST_F(SignalGeneratorTest, GeneratorIsReusable) {
    StrategyConfig config;
    config.indicators = {IndicatorToggle::Rsi};
    auto generator = StrategyFactory::createSignalGenerator(config);

    IndicatorFrame indicators = buildIndicatorFrame(makeSeries(fallRiseFall()), config);
    SignalFrame first = generator->generate(indicators);
    // A declining run in between must not leak its open position into the next call
    generator->generate(buildIndicatorFrame(makeSeries(linearDecline()), config));
    SignalFrame second = generator->generate(indicators);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first.signals[i].buy_signal, second.signals[i].buy_signal) << "bar " << i;
        EXPECT_EQ(first.signals[i].sell_signal, second.signals[i].sell_signal) << "bar " << i;
        EXPECT_EQ(first.signals[i].position_state, second.signals[i].position_state) << "bar " << i;
    }
}

TEST_F(SignalGeneratorTest, FrameKeepsIndicatorColumns) {
    StrategyConfig config;
    SignalFrame frame = run(linearDecline(), config);
    EXPECT_EQ(frame.indicators.size(), frame.size());
    EXPECT_EQ(frame.indicators.rsi.size(), frame.size());
    EXPECT_EQ(frame.indicators.bb_upper.size(), frame.size());
    EXPECT_DOUBLE_EQ(frame.indicators.bars[5].close, 195.0);
}

TEST_F(SignalGeneratorTest, RequiresRules) {
    EXPECT_THROW({
        SignalGenerator empty_entry("NoEntry", {}, singleRule("Out", core::SignalAction::ExitLong));
    }, core::InvalidInputException);
    EXPECT_THROW({
        SignalGenerator empty_exit("NoExit", singleRule("In", core::SignalAction::EnterLong), {});
    }, core::InvalidInputException);
    EXPECT_THROW({
        SignalGenerator unnamed("", singleRule("In", core::SignalAction::EnterLong),
                                singleRule("Out", core::SignalAction::ExitLong));
    }, core::InvalidInputException);
}
