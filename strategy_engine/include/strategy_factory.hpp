#pragma once

#include <string>
#include <vector>
#include <memory> // For std::unique_ptr
#include <nlohmann/json.hpp>

#include "interfaces.hpp"
#include "strategy_config.hpp"
#include "signal_generator.hpp"

namespace strategy_engine {

    using json = nlohmann::json;

    class StrategyFactory {
    public:
        // Read a StrategyConfig from a JSON object. Absent keys keep their
        // defaults; wrong JSON types throw core::ConfigException, out-of-range
        // values core::InvalidInputException.
        static StrategyConfig parseConfig(const json& config);

        // Parse a JSON file from disk. Throws core::ConfigException when the
        // file cannot be opened or is not valid JSON.
        static json loadJsonFile(const std::string& path);

        // Build the entry/exit rules for the enabled indicators:
        //   RSI:  entry RSI < oversold,          exit RSI > overbought
        //   MACD: entry MACD crosses above signal, exit MACD crosses below signal
        //   MA:   entry Close > SMA_Fast,         exit Close < SMA_Fast
        // Entry sub-conditions are combined with combine_logic, exits always with OR.
        static std::unique_ptr<SignalGenerator> createSignalGenerator(const StrategyConfig& config);

    private:
        static std::vector<std::unique_ptr<ICondition>> entryConditions(const StrategyConfig& config);
        static std::vector<std::unique_ptr<ICondition>> exitConditions(const StrategyConfig& config);
    };

} // namespace strategy_engine
