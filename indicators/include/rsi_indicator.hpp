#pragma once

#include "indicators.hpp"
#include <vector>

namespace indicators {

    // Relative Strength Index, 0..100.
    //
    // Clipped gains and clipped loss magnitudes are averaged with a simple
    // trailing mean over `period` deltas; RSI = 100 - 100 / (1 + gain / loss).
    // The delta at index 0 counts as zero, so RSI is defined from index period-1.
    // Zero average loss gives 100, a window with no movement at all gives 50.
    core::IndicatorSeries rsi(const std::vector<double>& close, int period);

} // namespace indicators
