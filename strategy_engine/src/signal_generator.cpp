#include "signal_generator.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <sstream>

namespace strategy_engine {

SignalGenerator::SignalGenerator(std::string name,
                                 std::vector<std::unique_ptr<IRule>> entry_rules,
                                 std::vector<std::unique_ptr<IRule>> exit_rules)
    : name_(std::move(name)),
      entry_rules_(std::move(entry_rules)),
      exit_rules_(std::move(exit_rules))
{
    if (name_.empty()) throw core::InvalidInputException("strategy_name", "Strategy name cannot be empty.");
    if (entry_rules_.empty()) throw core::InvalidInputException("entry_rules", "Strategy must have at least one entry rule.");
    if (exit_rules_.empty()) throw core::InvalidInputException("exit_rules", "Strategy must have at least one exit rule.");
    for (const auto& rule : entry_rules_) {
        if (!rule) throw core::InvalidInputException("entry_rules", "Entry rule cannot be null.");
    }
    for (const auto& rule : exit_rules_) {
        if (!rule) throw core::InvalidInputException("exit_rules", "Exit rule cannot be null.");
    }

    core::logging::getLogger()->debug("SignalGenerator '{}' created.", name_);
}

core::SignalAction SignalGenerator::evaluateRules(const std::vector<std::unique_ptr<IRule>>& rules,
                                                  const MarketDataSnapshot& snapshot,
                                                  core::SignalAction wanted) const {
    for (const auto& rule : rules) {
        if (rule->evaluate(snapshot) == wanted) {
            core::logging::getLogger()->debug("Strategy '{}': rule '{}' triggered {} at bar {}",
                                              name_, rule->getName(), core::toString(wanted), snapshot.index);
            return wanted;
        }
    }
    return core::SignalAction::None;
}

SignalFrame SignalGenerator::generate(IndicatorFrame frame) const {
    auto logger = core::logging::getLogger();
    logger->info("Generating signals for strategy '{}' over {} bars.", name_, frame.size());

    SignalFrame result;
    result.signals.reserve(frame.size());

    core::PositionState position = core::PositionState::Flat;
    size_t buys = 0;
    size_t sells = 0;

    MarketDataSnapshot snapshot;
    snapshot.frame = &frame;

    for (size_t i = 0; i < frame.size(); ++i) {
        snapshot.index = i;
        snapshot.current_time = frame.bars[i].timestamp;

        SignalPoint point;
        if (position == core::PositionState::Flat) {
            if (evaluateRules(entry_rules_, snapshot, core::SignalAction::EnterLong) == core::SignalAction::EnterLong) {
                point.buy_signal = true;
                position = core::PositionState::Long;
                ++buys;
            }
        } else {
            if (evaluateRules(exit_rules_, snapshot, core::SignalAction::ExitLong) == core::SignalAction::ExitLong) {
                point.sell_signal = true;
                position = core::PositionState::Flat;
                ++sells;
            }
        }
        point.position_state = position;
        result.signals.push_back(point);

        logger->trace("Bar {}: buy={} sell={} position={}", i, point.buy_signal, point.sell_signal,
                      core::toString(position));
    }

    logger->info("Strategy '{}' produced {} buy and {} sell signals.", name_, buys, sells);

    result.indicators = std::move(frame);
    return result;
}

std::string SignalGenerator::describe() const {
    std::stringstream ss;
    ss << "Strategy '" << name_ << "'";
    for (const auto& rule : entry_rules_) {
        ss << "\n  entry: " << rule->describe();
    }
    for (const auto& rule : exit_rules_) {
        ss << "\n  exit:  " << rule->describe();
    }
    return ss.str();
}

} // namespace strategy_engine
