#include "ema_indicator.hpp"
#include "logging.hpp"
#include <optional>

// TA_EMA seeds with the SMA of the first span values; the recursion here is
// seeded by the first value instead, which changes the early outputs.
namespace indicators {

core::IndicatorSeries ema(const core::IndicatorSeries& values, int span) {
    requireWindow("ema_span", span);
    core::logging::getLogger()->trace("Calculating EMA({}) over {} values...", span, values.size());

    const double alpha = 2.0 / (static_cast<double>(span) + 1.0);

    core::IndicatorSeries result(values.size());
    std::optional<double> state;
    int observed = 0;

    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i]) {
            continue;
        }
        const double value = *values[i];
        if (!state) {
            state = value;
        } else {
            // Same as alpha * value + (1 - alpha) * state, but exact on a flat input
            state = *state + alpha * (value - *state);
        }
        ++observed;
        if (observed >= span) {
            result[i] = state;
        }
    }
    return result;
}

core::IndicatorSeries ema(const std::vector<double>& values, int span) {
    return ema(core::IndicatorSeries(values.begin(), values.end()), span);
}

} // namespace indicators
