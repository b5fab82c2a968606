#pragma once

#include "interfaces.hpp"
#include "indicator_frame.hpp"
#include "datatypes.hpp"
#include <string>
#include <vector>
#include <memory> // For std::unique_ptr

namespace strategy_engine {

    struct SignalPoint {
        bool buy_signal = false;
        bool sell_signal = false;
        core::PositionState position_state = core::PositionState::Flat; // State after this bar
    };

    // IndicatorFrame plus one SignalPoint per bar
    struct SignalFrame {
        IndicatorFrame indicators;
        core::TimeSeries<SignalPoint> signals;

        size_t size() const { return signals.size(); }
    };

    // --- SignalGenerator Class ---
    // Runs the FLAT/LONG state machine over an IndicatorFrame. Entry rules are
    // only checked while FLAT, exit rules only while LONG; the first rule that
    // triggers wins. The position state lives inside generate(), so one
    // generator can be reused for any number of frames.
    class SignalGenerator {
    public:
        SignalGenerator(std::string name,
                        std::vector<std::unique_ptr<IRule>> entry_rules,
                        std::vector<std::unique_ptr<IRule>> exit_rules);

        const std::string& getName() const { return name_; }

        SignalFrame generate(IndicatorFrame frame) const;

        std::string describe() const;

    private:
        core::SignalAction evaluateRules(const std::vector<std::unique_ptr<IRule>>& rules,
                                         const MarketDataSnapshot& snapshot,
                                         core::SignalAction wanted) const;

        std::string name_;
        std::vector<std::unique_ptr<IRule>> entry_rules_;
        std::vector<std::unique_ptr<IRule>> exit_rules_;
    };

} // namespace strategy_engine
