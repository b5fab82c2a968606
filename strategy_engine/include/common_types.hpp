#pragma once

#include "datatypes.hpp" // Provides core types
#include <string>

namespace strategy_engine {

    // Enum for comparison types
    enum class ComparisonOp {
        GT,  // Greater Than (>)
        LT,  // Less Than (<)
        GTE, // Greater Than or Equal To (>=)
        LTE, // Less Than or Equal To (<=)
        EQ   // Equal To (==)
    };

    // Columns of an IndicatorFrame a condition can read
    enum class IndicatorField {
        Close,
        Rsi,
        Macd,
        MacdSignal,
        MacdHistogram,
        SmaFast,
        SmaSlow,
        BbUpper,
        BbMiddle,
        BbLower
    };

    // How enabled entry sub-conditions are combined. Exits always use OR.
    enum class CombineLogic {
        And,
        Or
    };

    enum class IndicatorToggle {
        Rsi,
        Macd,
        MovingAverage
    };

    std::string toString(ComparisonOp op);
    std::string toString(IndicatorField field);
    std::string toString(CombineLogic logic);
    std::string toString(IndicatorToggle toggle);

} // namespace strategy_engine
