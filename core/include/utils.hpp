#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Format a Timestamp as ISO 8601 UTC, e.g. 2024-03-01T00:00:00Z
    std::string timestampToString(const Timestamp& ts);

    // Parse "YYYY-MM-DD" (midnight UTC) or "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM]"
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Throws InvalidInputException if the series is empty, has non-increasing
    // timestamps, or carries non-positive / non-finite close prices.
    void validatePriceSeries(const PriceSeries& series);

    // Round half away from zero to a fixed number of decimals
    double roundTo(double value, int decimals);

} // namespace utils
} // namespace core
