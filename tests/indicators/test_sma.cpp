#include <gtest/gtest.h>
#include <vector>

#include "test_base.hpp"
#include "sma_indicator.hpp"
#include "indicators.hpp"
#include "exceptions.hpp"

using namespace indicators;

class SmaIndicatorTest : public ::testing::Test {};

TEST_F(SmaIndicatorTest, TrailingMeanWithWarmUp) {
    core::IndicatorSeries result = sma({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
    ASSERT_EQ(result.size(), 5u);
    EXPECT_FALSE(result[0].has_value());
    EXPECT_FALSE(result[1].has_value());
    ASSERT_TRUE(result[2].has_value());
    EXPECT_NEAR(*result[2], 2.0, 1e-12);
    EXPECT_NEAR(*result[3], 3.0, 1e-12);
    EXPECT_NEAR(*result[4], 4.0, 1e-12);
}

TEST_F(SmaIndicatorTest, ShortInputIsAllEmpty) {
    core::IndicatorSeries result = sma({1.0, 2.0}, 5);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(backtest_testing::countDefined(result), 0u);
}

TEST_F(SmaIndicatorTest, WindowOfOneIsIdentity) {
    core::IndicatorSeries result = sma({4.0, 8.0, 15.0}, 1);
    ASSERT_EQ(backtest_testing::countDefined(result), 3u);
    EXPECT_NEAR(*result[2], 15.0, 1e-12);
}

TEST_F(SmaIndicatorTest, NonPositiveWindowThrows) {
    EXPECT_THROW(sma({1.0, 2.0}, 0), core::InvalidInputException);
    EXPECT_THROW(sma({1.0, 2.0}, -3), core::InvalidInputException);
}

TEST_F(SmaIndicatorTest, ValuesDependOnlyOnPastCloses) {
    std::vector<double> closes = backtest_testing::linearDecline(40);
    core::IndicatorSeries full = sma(closes, 10);

    std::vector<double> changed = closes;
    changed[30] = 500.0;
    core::IndicatorSeries altered = sma(changed, 10);

    for (size_t i = 0; i < 30; ++i) {
        ASSERT_EQ(full[i].has_value(), altered[i].has_value()) << "bar " << i;
        if (full[i]) {
            EXPECT_DOUBLE_EQ(*full[i], *altered[i]) << "bar " << i;
        }
    }
}

TEST_F(SmaIndicatorTest, ClosePricesExtractsInOrder) {
    core::PriceSeries series = backtest_testing::makeSeries({3.0, 1.0, 2.0});
    EXPECT_EQ(closePrices(series), (std::vector<double>{3.0, 1.0, 2.0}));
}
