#pragma once

#include <vector>

#include "datatypes.hpp"
#include "backtest_config.hpp"

namespace backtester {

    // --- Performance Report Struct ---
    // Percentages are in percent units (12.5 means 12.5%), full precision.
    struct PerformanceReport {
        double total_return_pct = 0.0;
        double sharpe_ratio = 0.0;       // 0 with fewer than two returns or zero volatility
        double max_drawdown_pct = 0.0;   // <= 0
        double volatility_pct = 0.0;     // Annualized
        double win_rate_pct = 0.0;
        double win_loss_ratio = 0.0;     // +infinity with wins and no losses
        int total_trades = 0;            // Closed round trips
        double avg_trade_pnl = 0.0;

        double final_portfolio_value = 0.0;
        int total_executions = 0;
        int winning_trades = 0;
        int losing_trades = 0;

        // Copy rounded for presentation: 2 decimals for percentages and
        // currency, 3 for ratios
        PerformanceReport rounded() const;

        // Logs the rounded report through the shared logger
        void logReport() const;
    };

    class MetricsCalculator {
    public:
        explicit MetricsCalculator(BacktestConfig config);

        // Throws core::InvalidInputException on an empty curve
        PerformanceReport calculate(const core::EquityCurve& equity_curve,
                                    const std::vector<core::Trade>& closed_trades,
                                    int total_executions = 0) const;

        // v[t] / v[t-1] - 1 for t > 0
        static std::vector<double> periodicReturns(const core::EquityCurve& equity_curve);

    private:
        BacktestConfig config_;
    };

} // namespace backtester
