#include "sma_indicator.hpp"
#include "exceptions.hpp"   // For IndicatorCalculationException
#include "logging.hpp"      // For logging
#include "ta_libc.h"        // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <vector>

namespace indicators {

core::IndicatorSeries sma(const std::vector<double>& values, int window) {
    requireWindow("sma_window", window);

    auto logger = core::logging::getLogger();
    logger->trace("Calculating SMA({}) over {} values...", window, values.size());

    core::IndicatorSeries result(values.size());

    // TA-Lib lookback for SMA is window - 1
    const int lookback = TA_MA_Lookback(window, TA_MAType_SMA);
    if (lookback < 0) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback));
    }
    if (values.size() <= static_cast<size_t>(lookback)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for SMA({}). No values defined.",
                      values.size(), lookback, window);
        return result;
    }

    std::vector<double> out(values.size() - static_cast<size_t>(lookback));
    int out_begin_idx = 0;
    int out_nb_element = 0;

    TA_RetCode ret_code = TA_MA(
        0,                                  // startIdx
        static_cast<int>(values.size()) - 1,// endIdx
        values.data(),                      // inReal
        window,                             // optInTimePeriod
        TA_MAType_SMA,                      // optInMAType
        &out_begin_idx,                     // outBegIdx
        &out_nb_element,                    // outNbElement
        out.data()                          // outReal
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib TA_MA failed for SMA({}) with error code: {}", window, static_cast<int>(ret_code)));
    }
    if (out_begin_idx != lookback) {
        logger->warn("TA_MA out_begin_idx ({}) does not match lookback ({}) for SMA({}).",
                     out_begin_idx, lookback, window);
    }

    alignOutput(out, out_begin_idx, out_nb_element, result);
    logger->trace("Calculated {} SMA({}) values", out_nb_element, window);
    return result;
}

} // namespace indicators
