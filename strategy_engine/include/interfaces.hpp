#pragma once

#include <string>
#include <optional>

#include "datatypes.hpp"       // Provides Timestamp, SignalAction etc.
#include "common_types.hpp"
#include "indicator_frame.hpp"

namespace strategy_engine {

    // View of one bar of an IndicatorFrame, handed to conditions.
    // Only data at or before `index` is reachable through it.
    struct MarketDataSnapshot {
        const IndicatorFrame* frame = nullptr;
        size_t index = 0;
        core::Timestamp current_time;

        std::optional<double> value(IndicatorField field) const {
            return frame ? frame->value(field, index) : std::nullopt;
        }

        // Value on the previous bar; empty on the first bar
        std::optional<double> previousValue(IndicatorField field) const {
            if (!frame || index == 0) {
                return std::nullopt;
            }
            return frame->value(field, index - 1);
        }
    };

    // --- Condition Interface ---
    // Represents a single logical condition (e.g., Close > SMA, RSI < 30)
    class ICondition {
    public:
        virtual ~ICondition() = default;
        // Evaluates the condition on the snapshot. Undefined inputs evaluate to false.
        virtual bool evaluate(const MarketDataSnapshot& snapshot) const = 0;
        virtual std::string describe() const = 0;
    };

    // --- Rule Interface ---
    // An entry or exit rule: a condition plus the action it triggers
    class IRule {
    public:
        virtual ~IRule() = default;
        // Returns the action if triggered, None otherwise
        virtual core::SignalAction evaluate(const MarketDataSnapshot& snapshot) const = 0;
        virtual std::string describe() const = 0;
        virtual std::string getName() const = 0;
    };

} // namespace strategy_engine
