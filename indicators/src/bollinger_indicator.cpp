#include "bollinger_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"  // TA-Lib C API header
#include <spdlog/fmt/fmt.h>
#include <cmath>      // For std::isfinite
#include <vector>

namespace indicators {

BollingerBands bollinger(const std::vector<double>& close, int window, double num_std) {
    requireWindow("bb_period", window, 2); // TA_BBANDS rejects a period of 1
    if (!std::isfinite(num_std) || num_std <= 0.0) {
        throw core::InvalidInputException("bb_num_std",
            fmt::format("bb_num_std must be positive, got {}.", num_std));
    }

    auto logger = core::logging::getLogger();
    logger->trace("Calculating BBANDS({}, {}) over {} closes...", window, num_std, close.size());

    BollingerBands bands;
    bands.upper.resize(close.size());
    bands.middle.resize(close.size());
    bands.lower.resize(close.size());

    const int lookback = TA_BBANDS_Lookback(window, num_std, num_std, TA_MAType_SMA);
    if (lookback < 0) {
        throw core::IndicatorCalculationException(
            fmt::format("TA_BBANDS_Lookback returned an unexpected value: {}", lookback));
    }
    if (close.size() <= static_cast<size_t>(lookback)) {
        logger->debug("Input size ({}) is less than or equal to lookback ({}) for BBANDS({}). No values defined.",
                      close.size(), lookback, window);
        return bands;
    }

    const size_t output_size = close.size() - static_cast<size_t>(lookback);
    std::vector<double> upper(output_size);
    std::vector<double> middle(output_size);
    std::vector<double> lower(output_size);
    int out_begin_idx = 0;
    int out_nb_element = 0;

    // TA-Lib uses the population standard deviation around the SMA
    TA_RetCode ret_code = TA_BBANDS(
        0,                                  // startIdx
        static_cast<int>(close.size()) - 1, // endIdx
        close.data(),                       // inReal
        window,                             // optInTimePeriod
        num_std,                            // optInNbDevUp
        num_std,                            // optInNbDevDn
        TA_MAType_SMA,                      // optInMAType
        &out_begin_idx,
        &out_nb_element,
        upper.data(),
        middle.data(),
        lower.data()
    );

    if (ret_code != TA_SUCCESS) {
        throw core::IndicatorCalculationException(
            fmt::format("TA-Lib TA_BBANDS failed for BBANDS({}) with error code: {}", window, static_cast<int>(ret_code)));
    }

    alignOutput(upper, out_begin_idx, out_nb_element, bands.upper);
    alignOutput(middle, out_begin_idx, out_nb_element, bands.middle);
    alignOutput(lower, out_begin_idx, out_nb_element, bands.lower);
    return bands;
}

} // namespace indicators
