#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>

namespace strategy_engine {

    enum class CrossType {
        CrossesAbove,
        CrossesBelow
    };

    // --- IndicatorCrossCondition Class ---
    // True on the bar where field1 crosses field2:
    //   CrossesAbove: prev1 <= prev2 && now1 > now2
    //   CrossesBelow: prev1 >= prev2 && now1 < now2
    // False on the first bar and whenever one of the four values is undefined.
    class IndicatorCrossCondition : public ICondition {
    public:
        IndicatorCrossCondition(IndicatorField field1, CrossType cross_type, IndicatorField field2);

        ~IndicatorCrossCondition() override = default;

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        IndicatorField field1_;
        CrossType cross_type_;
        IndicatorField field2_;
    };

} // namespace strategy_engine
