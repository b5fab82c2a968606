#include "rsi_indicator.hpp"
#include "sma_indicator.hpp"
#include "logging.hpp"
#include <algorithm> // For std::max
#include <vector>

namespace indicators {

core::IndicatorSeries rsi(const std::vector<double>& close, int period) {
    requireWindow("rsi_period", period);

    auto logger = core::logging::getLogger();
    logger->trace("Calculating RSI({}) over {} closes...", period, close.size());

    // Clipped deltas; index 0 has no predecessor and contributes nothing
    std::vector<double> gains(close.size(), 0.0);
    std::vector<double> losses(close.size(), 0.0);
    for (size_t i = 1; i < close.size(); ++i) {
        const double delta = close[i] - close[i - 1];
        gains[i] = std::max(delta, 0.0);
        losses[i] = std::max(-delta, 0.0);
    }

    const core::IndicatorSeries avg_gain = sma(gains, period);
    const core::IndicatorSeries avg_loss = sma(losses, period);

    core::IndicatorSeries result(close.size());
    for (size_t i = 0; i < close.size(); ++i) {
        if (!avg_gain[i] || !avg_loss[i]) {
            continue;
        }
        // Running sums may leave a residue just below zero
        const double gain = std::max(*avg_gain[i], 0.0);
        const double loss = std::max(*avg_loss[i], 0.0);

        if (loss <= 0.0) {
            result[i] = gain > 0.0 ? 100.0 : 50.0;
        } else {
            const double rs = gain / loss;
            result[i] = 100.0 - 100.0 / (1.0 + rs);
        }
    }

    logger->trace("Successfully calculated RSI({})", period);
    return result;
}

} // namespace indicators
