#pragma once

#include "indicators.hpp"
#include <vector>

namespace indicators {

    // Trailing arithmetic mean over `window` values.
    // Defined from index window-1.
    core::IndicatorSeries sma(const std::vector<double>& values, int window);

} // namespace indicators
