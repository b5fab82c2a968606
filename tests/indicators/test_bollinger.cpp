#include <gtest/gtest.h>
#include <cmath>
#include <vector>

#include "test_base.hpp"
#include "bollinger_indicator.hpp"
#include "exceptions.hpp"

using namespace indicators;

class BollingerIndicatorTest : public ::testing::Test {};

TEST_F(BollingerIndicatorTest, UsesPopulationStandardDeviation) {
    BollingerBands bands = bollinger({1.0, 2.0, 3.0, 4.0}, 3, 2.0);
    ASSERT_EQ(bands.middle.size(), 4u);
    EXPECT_FALSE(bands.middle[1].has_value());

    const double sigma = std::sqrt(2.0 / 3.0);
    ASSERT_TRUE(bands.middle[2].has_value());
    EXPECT_NEAR(*bands.middle[2], 2.0, 1e-9);
    EXPECT_NEAR(*bands.upper[2], 2.0 + 2.0 * sigma, 1e-9);
    EXPECT_NEAR(*bands.lower[2], 2.0 - 2.0 * sigma, 1e-9);
    EXPECT_NEAR(*bands.middle[3], 3.0, 1e-9);
    EXPECT_NEAR(*bands.upper[3], 3.0 + 2.0 * sigma, 1e-9);
}

TEST_F(BollingerIndicatorTest, FlatMarketCollapsesBands) {
    BollingerBands bands = bollinger(backtest_testing::flat(30), 20, 2.0);
    for (size_t i = 19; i < 30; ++i) {
        EXPECT_NEAR(*bands.upper[i], 100.0, 1e-9);
        EXPECT_NEAR(*bands.lower[i], 100.0, 1e-9);
    }
}

TEST_F(BollingerIndicatorTest, ShortInputIsAllEmpty) {
    BollingerBands bands = bollinger({1.0, 2.0}, 20, 2.0);
    EXPECT_EQ(backtest_testing::countDefined(bands.upper), 0u);
    EXPECT_EQ(bands.upper.size(), 2u);
}

TEST_F(BollingerIndicatorTest, InvalidParametersThrow) {
    EXPECT_THROW(bollinger({1.0, 2.0, 3.0}, 1, 2.0), core::InvalidInputException);
    try {
        bollinger({1.0, 2.0, 3.0}, 2, 0.0);
        FAIL() << "Expected InvalidInputException";
    } catch (const core::InvalidInputException& e) {
        EXPECT_EQ(e.field(), "bb_num_std");
    }
}
