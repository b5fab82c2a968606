#include "composite_condition.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm> // For std::all_of, std::any_of

namespace strategy_engine {

CompositeCondition::CompositeCondition(CombineLogic logic, std::vector<std::unique_ptr<ICondition>> conditions)
    : logic_(logic), conditions_(std::move(conditions))
{
    if (conditions_.empty()) {
        throw core::InvalidInputException("conditions",
            fmt::format("{} condition must receive at least one condition.", toString(logic_)));
    }
    for (const auto& condition : conditions_) {
        if (!condition) {
            throw core::InvalidInputException("conditions",
                fmt::format("{} condition cannot hold a null condition.", toString(logic_)));
        }
    }
}

bool CompositeCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    auto holds = [&snapshot](const std::unique_ptr<ICondition>& condition) {
        return condition->evaluate(snapshot);
    };
    if (logic_ == CombineLogic::And) {
        return std::all_of(conditions_.begin(), conditions_.end(), holds);
    }
    return std::any_of(conditions_.begin(), conditions_.end(), holds);
}

std::string CompositeCondition::describe() const {
    std::vector<std::string> parts;
    parts.reserve(conditions_.size());
    for (const auto& condition : conditions_) {
        parts.push_back(condition->describe());
    }
    return fmt::format("({})", fmt::join(parts, fmt::format(" {} ", toString(logic_))));
}

} // namespace strategy_engine
