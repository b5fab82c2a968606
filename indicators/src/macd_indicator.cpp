#include "macd_indicator.hpp"
#include "ema_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

MacdResult macd(const std::vector<double>& close, int fast, int slow, int signal) {
    requireWindow("macd_fast", fast);
    requireWindow("macd_slow", slow);
    requireWindow("macd_signal", signal);
    if (fast >= slow) {
        throw core::InvalidInputException("macd_fast",
            fmt::format("macd_fast ({}) must be smaller than macd_slow ({}).", fast, slow));
    }

    auto logger = core::logging::getLogger();
    logger->trace("Calculating MACD({},{},{}) over {} closes...", fast, slow, signal, close.size());

    const core::IndicatorSeries ema_fast = ema(close, fast);
    const core::IndicatorSeries ema_slow = ema(close, slow);

    MacdResult result;
    result.line.resize(close.size());
    result.histogram.resize(close.size());
    for (size_t i = 0; i < close.size(); ++i) {
        if (ema_fast[i] && ema_slow[i]) {
            result.line[i] = *ema_fast[i] - *ema_slow[i];
        }
    }

    result.signal = ema(result.line, signal);
    for (size_t i = 0; i < close.size(); ++i) {
        if (result.line[i] && result.signal[i]) {
            result.histogram[i] = *result.line[i] - *result.signal[i];
        }
    }

    logger->trace("Successfully calculated MACD({},{},{})", fast, slow, signal);
    return result;
}

} // namespace indicators
