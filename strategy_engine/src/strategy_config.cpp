#include "strategy_config.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>   // For std::isfinite
#include <vector>

namespace strategy_engine {

namespace {

    void requirePositive(const char* field, int value) {
        if (value <= 0) {
            throw core::InvalidInputException(field, fmt::format("{} must be positive, got {}.", field, value));
        }
    }

    void requirePercentRange(const char* field, double value) {
        if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
            throw core::InvalidInputException(field, fmt::format("{} must lie in [0, 100], got {}.", field, value));
        }
    }

} // namespace

void StrategyConfig::validate() const {
    if (strategy_name.empty()) {
        throw core::InvalidInputException("strategy_name", "strategy_name cannot be empty.");
    }

    requirePositive("rsi_period", rsi_period);
    requirePercentRange("rsi_oversold", rsi_oversold);
    requirePercentRange("rsi_overbought", rsi_overbought);
    if (rsi_oversold >= rsi_overbought) {
        throw core::InvalidInputException("rsi_oversold",
            fmt::format("rsi_oversold ({}) must be below rsi_overbought ({}).", rsi_oversold, rsi_overbought));
    }

    requirePositive("macd_fast", macd_fast);
    requirePositive("macd_slow", macd_slow);
    requirePositive("macd_signal", macd_signal);
    if (macd_fast >= macd_slow) {
        throw core::InvalidInputException("macd_fast",
            fmt::format("macd_fast ({}) must be smaller than macd_slow ({}).", macd_fast, macd_slow));
    }

    requirePositive("ma_fast_period", ma_fast_period);
    requirePositive("ma_slow_period", ma_slow_period);
    if (ma_fast_period >= ma_slow_period) {
        throw core::InvalidInputException("ma_fast_period",
            fmt::format("ma_fast_period ({}) must be smaller than ma_slow_period ({}).", ma_fast_period, ma_slow_period));
    }

    if (bb_period < 2) {
        throw core::InvalidInputException("bb_period", fmt::format("bb_period must be at least 2, got {}.", bb_period));
    }
    if (!std::isfinite(bb_num_std) || bb_num_std <= 0.0) {
        throw core::InvalidInputException("bb_num_std", fmt::format("bb_num_std must be positive, got {}.", bb_num_std));
    }

    // With nothing enabled an AND entry would hold on every bar
    if (indicators.empty()) {
        throw core::InvalidInputException("indicators", "At least one of RSI, MACD, MA must be enabled.");
    }
}

std::string StrategyConfig::describe() const {
    std::vector<std::string> enabled;
    for (IndicatorToggle toggle : indicators) {
        enabled.push_back(toString(toggle));
    }
    return fmt::format("{}: RSI({}) {}/{}, MACD({},{},{}), SMA({},{}), BB({},{}), logic={}, indicators=[{}]",
                       strategy_name, rsi_period, rsi_oversold, rsi_overbought,
                       macd_fast, macd_slow, macd_signal,
                       ma_fast_period, ma_slow_period, bb_period, bb_num_std,
                       toString(combine_logic), fmt::join(enabled, ", "));
}

} // namespace strategy_engine
