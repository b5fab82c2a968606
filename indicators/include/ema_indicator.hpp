#pragma once

#include "indicators.hpp"
#include <vector>

namespace indicators {

    // Exponential moving average, alpha = 2 / (span + 1).
    //
    // Recursive, seeded by the first defined input (not by an SMA of the first
    // span values). Output stays empty until `span` inputs have been observed.
    // Empty inputs are skipped, so the EMA of a warming-up series starts at the
    // first value that series defines.
    core::IndicatorSeries ema(const core::IndicatorSeries& values, int span);

    core::IndicatorSeries ema(const std::vector<double>& values, int span);

} // namespace indicators
