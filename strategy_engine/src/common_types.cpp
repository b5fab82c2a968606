#include "common_types.hpp"

namespace strategy_engine {

std::string toString(ComparisonOp op) {
    switch (op) {
        case ComparisonOp::GT:  return ">";
        case ComparisonOp::LT:  return "<";
        case ComparisonOp::GTE: return ">=";
        case ComparisonOp::LTE: return "<=";
        case ComparisonOp::EQ:  return "==";
        default: return "InvalidOp";
    }
}

std::string toString(IndicatorField field) {
    switch (field) {
        case IndicatorField::Close:         return "Close";
        case IndicatorField::Rsi:           return "RSI";
        case IndicatorField::Macd:          return "MACD";
        case IndicatorField::MacdSignal:    return "MACD_Signal";
        case IndicatorField::MacdHistogram: return "MACD_Histogram";
        case IndicatorField::SmaFast:       return "SMA_Fast";
        case IndicatorField::SmaSlow:       return "SMA_Slow";
        case IndicatorField::BbUpper:       return "BB_Upper";
        case IndicatorField::BbMiddle:      return "BB_Middle";
        case IndicatorField::BbLower:       return "BB_Lower";
        default: return "InvalidField";
    }
}

std::string toString(CombineLogic logic) {
    return logic == CombineLogic::And ? "AND" : "OR";
}

std::string toString(IndicatorToggle toggle) {
    switch (toggle) {
        case IndicatorToggle::Rsi:           return "RSI";
        case IndicatorToggle::Macd:          return "MACD";
        case IndicatorToggle::MovingAverage: return "MA";
        default: return "InvalidToggle";
    }
}

} // namespace strategy_engine
