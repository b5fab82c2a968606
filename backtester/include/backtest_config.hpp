#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace backtester {

    using json = nlohmann::json;

    // Execution and reporting parameters of one backtest run
    struct BacktestConfig {
        double initial_capital = 10000.0;
        double commission_rate = 0.001;  // Fraction of traded notional, per leg
        double risk_free_rate = 0.02;    // Annual, used by the Sharpe ratio
        int periods_per_year = 252;
        bool liquidate_at_end = false;   // Close an open position at the last bar

        // Throws core::InvalidInputException naming the offending field
        void validate() const;

        // Reads the optional keys of a "backtest" JSON object on top of the defaults
        static BacktestConfig fromJson(const json& node);
    };

} // namespace backtester
