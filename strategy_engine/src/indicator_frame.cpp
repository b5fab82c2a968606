#include "indicator_frame.hpp"
#include "indicators.hpp"
#include "rsi_indicator.hpp"
#include "macd_indicator.hpp"
#include "sma_indicator.hpp"
#include "bollinger_indicator.hpp"
#include "utils.hpp"
#include "logging.hpp"

namespace strategy_engine {

std::optional<double> IndicatorFrame::value(IndicatorField field, size_t index) const {
    if (index >= bars.size()) {
        return std::nullopt;
    }

    const core::IndicatorSeries* column = nullptr;
    switch (field) {
        case IndicatorField::Close:         return bars[index].close;
        case IndicatorField::Rsi:           column = &rsi; break;
        case IndicatorField::Macd:          column = &macd; break;
        case IndicatorField::MacdSignal:    column = &macd_signal; break;
        case IndicatorField::MacdHistogram: column = &macd_histogram; break;
        case IndicatorField::SmaFast:       column = &sma_fast; break;
        case IndicatorField::SmaSlow:       column = &sma_slow; break;
        case IndicatorField::BbUpper:       column = &bb_upper; break;
        case IndicatorField::BbMiddle:      column = &bb_mid; break;
        case IndicatorField::BbLower:       column = &bb_lower; break;
    }

    if (!column || index >= column->size()) {
        return std::nullopt;
    }
    return (*column)[index];
}

IndicatorFrame buildIndicatorFrame(const core::PriceSeries& series, const StrategyConfig& config) {
    auto logger = core::logging::getLogger();

    core::utils::validatePriceSeries(series);
    config.validate();

    std::vector<double> close = indicators::closePrices(series);

    IndicatorFrame frame;
    frame.bars = series;

    // All columns are computed regardless of the toggles so a frame can be
    // inspected for any indicator.
    frame.rsi = indicators::rsi(close, config.rsi_period);

    indicators::MacdResult macd = indicators::macd(close, config.macd_fast, config.macd_slow, config.macd_signal);
    frame.macd = std::move(macd.line);
    frame.macd_signal = std::move(macd.signal);
    frame.macd_histogram = std::move(macd.histogram);

    frame.sma_fast = indicators::sma(close, config.ma_fast_period);
    frame.sma_slow = indicators::sma(close, config.ma_slow_period);

    indicators::BollingerBands bands = indicators::bollinger(close, config.bb_period, config.bb_num_std);
    frame.bb_upper = std::move(bands.upper);
    frame.bb_mid = std::move(bands.middle);
    frame.bb_lower = std::move(bands.lower);

    logger->debug("Indicator frame built over {} bars.", frame.size());
    return frame;
}

} // namespace strategy_engine
