#pragma once

#include "indicators.hpp"
#include <vector>

namespace indicators {

    struct MacdResult {
        core::IndicatorSeries line;      // ema(close, fast) - ema(close, slow)
        core::IndicatorSeries signal;    // ema(line, signal)
        core::IndicatorSeries histogram; // line - signal
    };

    // Moving Average Convergence Divergence.
    // line is defined from slow-1, signal and histogram from slow+signal-2.
    // Requires fast < slow.
    MacdResult macd(const std::vector<double>& close, int fast, int slow, int signal);

} // namespace indicators
