#pragma once

#include <vector>
#include <optional>

#include "datatypes.hpp"
#include "signal_generator.hpp" // SignalFrame
#include "backtest_config.hpp"

namespace backtester {

    struct SimulationResult {
        core::EquityCurve equity_curve;        // One point per bar
        std::vector<core::Trade> trades;       // Closed round trips, in order
        std::optional<core::Trade> open_trade; // Position still held after the last bar
        int total_executions = 0;              // Individual fills
        // Cash after the last bar. With liquidate_at_end this includes the
        // exit commission of the closing sale, which the equity curve (marked
        // before trading) does not show.
        double final_cash = 0.0;
    };

    // --- SimulationEngine Class ---
    // Single forward pass over a SignalFrame. Per bar the holdings are first
    // marked at the close, then a buy (while flat) or a sell (while long) is
    // filled at that close. Signals that do not match the position are ignored.
    class SimulationEngine {
    public:
        explicit SimulationEngine(BacktestConfig config);

        // Throws core::InvalidInputException on an invalid series or a
        // signal column whose length differs from the series.
        SimulationResult run(const strategy_engine::SignalFrame& frame) const;

    private:
        BacktestConfig config_;
    };

} // namespace backtester
