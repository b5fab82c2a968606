#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <vector>
#include <memory> // For std::unique_ptr
#include <string>

namespace strategy_engine {

    // --- CompositeCondition Class ---
    // Joins sub-conditions with AND (all must hold) or OR (any may hold).
    // Evaluation stops at the first sub-condition that decides the result.
    class CompositeCondition : public ICondition {
    public:
        // Takes ownership of a non-empty vector of non-null conditions
        CompositeCondition(CombineLogic logic, std::vector<std::unique_ptr<ICondition>> conditions);

        ~CompositeCondition() override = default;

        bool evaluate(const MarketDataSnapshot& snapshot) const override;

        // "(A AND B)" / "(A OR B)"
        std::string describe() const override;

        CombineLogic getLogic() const { return logic_; }
        size_t size() const { return conditions_.size(); }

    private:
        CombineLogic logic_;
        std::vector<std::unique_ptr<ICondition>> conditions_;
    };

} // namespace strategy_engine
