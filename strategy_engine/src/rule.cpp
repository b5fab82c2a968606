#include "rule.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

Rule::Rule(std::string rule_name,
           std::unique_ptr<ICondition> condition,
           core::SignalAction action_on_true)
    : name_(std::move(rule_name)),
      condition_(std::move(condition)),
      action_(action_on_true)
{
    if (name_.empty()) {
         throw core::InvalidInputException("rule_name", "Rule name cannot be empty.");
    }
    if (!condition_) {
         throw core::InvalidInputException("condition", fmt::format("Condition cannot be null for Rule '{}'.", name_));
    }
    if (action_ == core::SignalAction::None) {
          throw core::InvalidInputException("action", fmt::format("Action cannot be 'None' for Rule '{}'.", name_));
    }
}

core::SignalAction Rule::evaluate(const MarketDataSnapshot& snapshot) const {
    bool condition_result = condition_->evaluate(snapshot);

    core::logging::getLogger()->trace("Rule '{}' at bar {} -> {}", name_, snapshot.index, condition_result);

    return condition_result ? action_ : core::SignalAction::None;
}

std::string Rule::describe() const {
    return fmt::format("Rule('{}'): IF {} THEN {}",
                       name_,
                       condition_->describe(),
                       core::toString(action_));
}

} // namespace strategy_engine
