#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <vector>

#include "datatypes.hpp"
#include "utils.hpp"

namespace backtest_testing {

    // Daily bars starting 2024-01-01 with open = high = low = close
    inline core::PriceSeries makeSeries(const std::vector<double>& closes) {
        core::PriceSeries series;
        series.reserve(closes.size());
        const core::Timestamp start = core::utils::stringToTimestamp("2024-01-01");
        for (size_t i = 0; i < closes.size(); ++i) {
            core::PriceBar bar;
            bar.timestamp = start + std::chrono::hours(24 * static_cast<int>(i));
            bar.open = closes[i];
            bar.high = closes[i];
            bar.low = closes[i];
            bar.close = closes[i];
            bar.volume = 1000;
            series.push_back(bar);
        }
        return series;
    }

    // 200, 199, ... : RSI hits 0 at bar 13, MACD never crosses its signal
    inline std::vector<double> linearDecline(size_t count = 60, double start = 200.0) {
        std::vector<double> closes;
        for (size_t i = 0; i < count; ++i) {
            closes.push_back(start - static_cast<double>(i));
        }
        return closes;
    }

    // 116 down to 101 (bars 0-15), up by 2 to 141 (bars 16-35), down by 1 for five bars.
    // RSI(14) is 0 at bar 13 (close 103) and first exceeds 70 at bar 23 (close 117).
    inline std::vector<double> fallRiseFall() {
        std::vector<double> closes;
        for (int i = 0; i < 16; ++i) closes.push_back(116.0 - i);
        for (int k = 1; k <= 20; ++k) closes.push_back(101.0 + 2.0 * k);
        for (int k = 1; k <= 5; ++k) closes.push_back(141.0 - k);
        return closes;
    }

    // 100 up to 129 (bars 0-29), then 127 down by 2 for fifteen bars.
    // Close first exceeds SMA(20) at bar 19 and drops below it at bar 33.
    inline std::vector<double> riseThenFall() {
        std::vector<double> closes;
        for (int i = 0; i < 30; ++i) closes.push_back(100.0 + i);
        for (int k = 0; k < 15; ++k) closes.push_back(127.0 - 2.0 * k);
        return closes;
    }

    inline std::vector<double> flat(size_t count = 60, double price = 100.0) {
        return std::vector<double>(count, price);
    }

    inline size_t countDefined(const core::IndicatorSeries& series) {
        size_t count = 0;
        for (const auto& value : series) {
            if (value) ++count;
        }
        return count;
    }

} // namespace backtest_testing
