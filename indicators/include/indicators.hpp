#pragma once

#include "datatypes.hpp" // Needs PriceSeries, IndicatorSeries
#include <string>
#include <vector>

// Indicator library: pure functions over a close-price sequence.
//
// Every function returns a series of the same length as its input. Positions
// inside the warm-up window are left empty (std::nullopt), never filled with
// a fabricated value. A non-positive window throws core::InvalidInputException.
namespace indicators {

    // Extract the close prices of a series, in order
    std::vector<double> closePrices(const core::PriceSeries& series);

    // Throws core::InvalidInputException naming `field` if window < minimum
    void requireWindow(const std::string& field, int window, int minimum = 1);

    // Copy a TA-Lib output buffer into a full-length series starting at out_begin_idx
    void alignOutput(const std::vector<double>& out, int out_begin_idx, int out_nb_element,
                     core::IndicatorSeries& result);

} // namespace indicators
