#include "strategy_factory.hpp"
#include "config_json.hpp"
#include "rule.hpp"
#include "indicator_condition.hpp"
#include "indicator_cross_condition.hpp"
#include "composite_condition.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm> // For std::transform
#include <cctype>    // For std::toupper
#include <fstream>   // For std::ifstream

namespace strategy_engine {

    namespace { // File-local helpers

        std::string toUpper(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return value;
        }

        CombineLogic stringToCombineLogic(const std::string& logic_str) {
            std::string upper = toUpper(logic_str);
            if (upper == "AND") return CombineLogic::And;
            if (upper == "OR") return CombineLogic::Or;
            throw core::InvalidInputException("combine_logic",
                fmt::format("Unknown combine_logic '{}', expected AND or OR.", logic_str));
        }

        IndicatorToggle stringToToggle(const std::string& name) {
            std::string upper = toUpper(name);
            if (upper == "RSI") return IndicatorToggle::Rsi;
            if (upper == "MACD") return IndicatorToggle::Macd;
            if (upper == "MA" || upper == "SMA") return IndicatorToggle::MovingAverage;
            throw core::InvalidInputException("indicators",
                fmt::format("Unknown indicator '{}', expected RSI, MACD or MA.", name));
        }

        std::unique_ptr<ICondition> combine(std::vector<std::unique_ptr<ICondition>> conditions, CombineLogic logic) {
            // A single condition needs no wrapper
            if (conditions.size() == 1) {
                return std::move(conditions.front());
            }
            return std::make_unique<CompositeCondition>(logic, std::move(conditions));
        }

    } // end anonymous namespace


    // --- Config Parsing ---
    StrategyConfig StrategyFactory::parseConfig(const json& config) {
        auto logger = core::logging::getLogger();
        config_json::requireObject(config, "Strategy config");

        StrategyConfig parsed;
        try {
            config_json::readString(config, "strategy_name", parsed.strategy_name);

            config_json::readInt(config, "rsi_period", parsed.rsi_period);
            config_json::readDouble(config, "rsi_oversold", parsed.rsi_oversold);
            config_json::readDouble(config, "rsi_overbought", parsed.rsi_overbought);

            config_json::readInt(config, "macd_fast", parsed.macd_fast);
            config_json::readInt(config, "macd_slow", parsed.macd_slow);
            config_json::readInt(config, "macd_signal", parsed.macd_signal);

            config_json::readInt(config, "ma_fast_period", parsed.ma_fast_period);
            config_json::readInt(config, "ma_slow_period", parsed.ma_slow_period);

            config_json::readInt(config, "bb_period", parsed.bb_period);
            config_json::readDouble(config, "bb_num_std", parsed.bb_num_std);

            std::string logic = toString(parsed.combine_logic);
            config_json::readString(config, "combine_logic", logic);
            parsed.combine_logic = stringToCombineLogic(logic);

            auto it = config.find("indicators");
            if (it != config.end()) {
                if (!it->is_array()) {
                    throw core::ConfigException("'indicators' must be an array of strings.");
                }
                parsed.indicators.clear();
                for (const auto& entry : *it) {
                    if (!entry.is_string()) {
                        throw core::ConfigException("'indicators' must be an array of strings.");
                    }
                    parsed.indicators.insert(stringToToggle(entry.get<std::string>()));
                }
            }
        } catch (const json::exception& e) {
            // e.g. a value nlohmann cannot convert to the target type
            throw core::ConfigException(fmt::format("Invalid strategy config: {}", e.what()));
        }

        parsed.validate();
        logger->info("Strategy config parsed: {}", parsed.describe());
        return parsed;
    }

    json StrategyFactory::loadJsonFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::ConfigException(fmt::format("Failed to open config file: {}", path));
        }
        try {
            return json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw core::ConfigException(fmt::format("Failed to parse config file '{}': {}", path, e.what()));
        }
    }


    // --- Rule Construction ---
    std::vector<std::unique_ptr<ICondition>> StrategyFactory::entryConditions(const StrategyConfig& config) {
        std::vector<std::unique_ptr<ICondition>> conditions;
        if (config.isEnabled(IndicatorToggle::Rsi)) {
            conditions.push_back(std::make_unique<IndicatorCondition>(
                IndicatorField::Rsi, ComparisonOp::LT, config.rsi_oversold));
        }
        if (config.isEnabled(IndicatorToggle::Macd)) {
            conditions.push_back(std::make_unique<IndicatorCrossCondition>(
                IndicatorField::Macd, CrossType::CrossesAbove, IndicatorField::MacdSignal));
        }
        if (config.isEnabled(IndicatorToggle::MovingAverage)) {
            conditions.push_back(std::make_unique<IndicatorCondition>(
                IndicatorField::Close, ComparisonOp::GT, IndicatorField::SmaFast));
        }
        return conditions;
    }

    std::vector<std::unique_ptr<ICondition>> StrategyFactory::exitConditions(const StrategyConfig& config) {
        std::vector<std::unique_ptr<ICondition>> conditions;
        if (config.isEnabled(IndicatorToggle::Rsi)) {
            conditions.push_back(std::make_unique<IndicatorCondition>(
                IndicatorField::Rsi, ComparisonOp::GT, config.rsi_overbought));
        }
        if (config.isEnabled(IndicatorToggle::Macd)) {
            conditions.push_back(std::make_unique<IndicatorCrossCondition>(
                IndicatorField::Macd, CrossType::CrossesBelow, IndicatorField::MacdSignal));
        }
        if (config.isEnabled(IndicatorToggle::MovingAverage)) {
            conditions.push_back(std::make_unique<IndicatorCondition>(
                IndicatorField::Close, ComparisonOp::LT, IndicatorField::SmaFast));
        }
        return conditions;
    }

    std::unique_ptr<SignalGenerator> StrategyFactory::createSignalGenerator(const StrategyConfig& config) {
        auto logger = core::logging::getLogger();
        config.validate();

        std::vector<std::unique_ptr<IRule>> entry_rules;
        entry_rules.push_back(std::make_unique<Rule>(
            "Entry", combine(entryConditions(config), config.combine_logic), core::SignalAction::EnterLong));

        std::vector<std::unique_ptr<IRule>> exit_rules;
        exit_rules.push_back(std::make_unique<Rule>(
            "Exit", combine(exitConditions(config), CombineLogic::Or), core::SignalAction::ExitLong));

        auto generator = std::make_unique<SignalGenerator>(
            config.strategy_name, std::move(entry_rules), std::move(exit_rules));

        logger->info("Created signal generator:\n{}", generator->describe());
        return generator;
    }

} // namespace strategy_engine
