#pragma once

#include "common_types.hpp"
#include <set>
#include <string>

namespace strategy_engine {

    // Parameters of the RSI / MACD / MA strategy. Treated as an immutable value:
    // built once (defaults or StrategyFactory::parseConfig), validated, then
    // passed by const reference through the pipeline.
    struct StrategyConfig {
        std::string strategy_name = "RSI_MACD";

        int rsi_period = 14;
        double rsi_oversold = 30.0;
        double rsi_overbought = 70.0;

        int macd_fast = 12;
        int macd_slow = 26;
        int macd_signal = 9;

        int ma_fast_period = 20; // Reference average of the MA rule
        int ma_slow_period = 50;

        int bb_period = 20;
        double bb_num_std = 2.0;

        CombineLogic combine_logic = CombineLogic::And;
        std::set<IndicatorToggle> indicators = {IndicatorToggle::Rsi, IndicatorToggle::Macd};

        bool isEnabled(IndicatorToggle toggle) const {
            return indicators.count(toggle) > 0;
        }

        // Throws core::InvalidInputException naming the first offending field
        void validate() const;

        std::string describe() const;
    };

} // namespace strategy_engine
