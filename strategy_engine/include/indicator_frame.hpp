#pragma once

#include "datatypes.hpp"
#include "common_types.hpp"
#include "strategy_config.hpp"
#include <optional>

namespace strategy_engine {

    // The price series plus every indicator column, one entry per bar.
    // A column entry is empty while its indicator is warming up.
    struct IndicatorFrame {
        core::PriceSeries bars;
        core::IndicatorSeries rsi;
        core::IndicatorSeries macd;
        core::IndicatorSeries macd_signal;
        core::IndicatorSeries macd_histogram;
        core::IndicatorSeries sma_fast;
        core::IndicatorSeries sma_slow;
        core::IndicatorSeries bb_upper;
        core::IndicatorSeries bb_mid;
        core::IndicatorSeries bb_lower;

        size_t size() const { return bars.size(); }

        // Value of a column at a bar; empty when undefined or out of range
        std::optional<double> value(IndicatorField field, size_t index) const;
    };

    // Validates the series and the config, then computes all columns.
    IndicatorFrame buildIndicatorFrame(const core::PriceSeries& series, const StrategyConfig& config);

} // namespace strategy_engine
