#pragma once

#include "interfaces.hpp" // Includes ICondition, IRule, SignalAction etc.
#include <string>
#include <memory> // For std::unique_ptr

namespace strategy_engine {

    // --- Rule Class ---
    // A named condition bound to the action it requests: EnterLong for the
    // entry rule, ExitLong for the exit rule. evaluate() returns that action
    // when the condition holds on the snapshot and SignalAction::None otherwise.
    class Rule : public IRule {
    public:
        Rule(std::string rule_name,
             std::unique_ptr<ICondition> condition,
             core::SignalAction action_on_true);

        ~Rule() override = default;

        core::SignalAction evaluate(const MarketDataSnapshot& snapshot) const override;

        // Rule('Entry'): IF <condition> THEN EnterLong
        std::string describe() const override;

        std::string getName() const override { return name_; }
        core::SignalAction getAction() const { return action_; }

    private:
        std::string name_;
        std::unique_ptr<ICondition> condition_;
        core::SignalAction action_;
    };

} // namespace strategy_engine
