#pragma once

#include "interfaces.hpp"
#include "common_types.hpp"
#include <string>
#include <variant> // To hold either a double value or a second field

namespace strategy_engine {

    // --- IndicatorCondition Class ---
    // Compares a frame column against a fixed value OR another column on the current bar.
    class IndicatorCondition : public ICondition {
    public:
        // e.g., IndicatorCondition(IndicatorField::Rsi, ComparisonOp::LT, 30.0) -> "RSI < 30"
        IndicatorCondition(IndicatorField lhs, ComparisonOp op, double value);

        // e.g., IndicatorCondition(IndicatorField::Close, ComparisonOp::GT, IndicatorField::SmaFast)
        IndicatorCondition(IndicatorField lhs, ComparisonOp op, IndicatorField rhs);

        ~IndicatorCondition() override = default;

        bool evaluate(const MarketDataSnapshot& snapshot) const override;
        std::string describe() const override;

    private:
        IndicatorField lhs_;
        ComparisonOp op_;
        std::variant<double, IndicatorField> rhs_;
    };

} // namespace strategy_engine
