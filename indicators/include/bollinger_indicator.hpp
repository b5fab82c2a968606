#pragma once

#include "indicators.hpp"
#include <vector>

namespace indicators {

    struct BollingerBands {
        core::IndicatorSeries upper;  // middle + num_std * sigma
        core::IndicatorSeries middle; // SMA(window)
        core::IndicatorSeries lower;  // middle - num_std * sigma
    };

    // Bollinger Bands with sigma the trailing *population* standard deviation.
    // window must be at least 2, num_std positive. Defined from index window-1.
    BollingerBands bollinger(const std::vector<double>& close, int window, double num_std);

} // namespace indicators
