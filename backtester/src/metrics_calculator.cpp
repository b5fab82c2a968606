#include "metrics_calculator.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <algorithm> // For std::max, std::min
#include <cmath>     // For std::sqrt
#include <limits>    // For infinity
#include <numeric>   // For std::accumulate

namespace backtester {

    namespace {

        double mean(const std::vector<double>& values) {
            if (values.empty()) return 0.0;
            return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
        }

        // Sample standard deviation (n - 1); 0 with fewer than two values
        double sampleStdDev(const std::vector<double>& values) {
            if (values.size() < 2) return 0.0;
            const double m = mean(values);
            double sq_sum = 0.0;
            for (double v : values) {
                sq_sum += (v - m) * (v - m);
            }
            return std::sqrt(sq_sum / static_cast<double>(values.size() - 1));
        }

    } // namespace

    // --- PerformanceReport ---

    PerformanceReport PerformanceReport::rounded() const {
        using core::utils::roundTo;
        PerformanceReport r = *this;
        r.total_return_pct = roundTo(total_return_pct, 2);
        r.sharpe_ratio = roundTo(sharpe_ratio, 3);
        r.max_drawdown_pct = roundTo(max_drawdown_pct, 2);
        r.volatility_pct = roundTo(volatility_pct, 2);
        r.win_rate_pct = roundTo(win_rate_pct, 2);
        r.win_loss_ratio = roundTo(win_loss_ratio, 3);
        r.avg_trade_pnl = roundTo(avg_trade_pnl, 2);
        r.final_portfolio_value = roundTo(final_portfolio_value, 2);
        return r;
    }

    void PerformanceReport::logReport() const {
        auto logger = core::logging::getLogger();
        const PerformanceReport r = rounded();
        logger->info("--- Backtest Metrics ---");
        logger->info("Total Return: {:.2f}%", r.total_return_pct);
        logger->info("Sharpe Ratio: {:.3f}", r.sharpe_ratio);
        logger->info("Max Drawdown: {:.2f}%", r.max_drawdown_pct);
        logger->info("Volatility: {:.2f}%", r.volatility_pct);
        logger->info("Win Rate: {:.2f}%", r.win_rate_pct);
        logger->info("Win/Loss Ratio: {:.3f}", r.win_loss_ratio);
        logger->info("Total Trades: {} (won {}, lost {})", r.total_trades, r.winning_trades, r.losing_trades);
        logger->info("Total Executions: {}", r.total_executions);
        logger->info("Avg Trade PnL: {:.2f}", r.avg_trade_pnl);
        logger->info("Final Portfolio Value: {:.2f}", r.final_portfolio_value);
        logger->info("------------------------");
    }

    // --- MetricsCalculator ---

    MetricsCalculator::MetricsCalculator(BacktestConfig config)
        : config_(config)
    {
        config_.validate();
    }

    std::vector<double> MetricsCalculator::periodicReturns(const core::EquityCurve& equity_curve) {
        std::vector<double> returns;
        if (equity_curve.size() < 2) return returns;
        returns.reserve(equity_curve.size() - 1);
        for (size_t i = 1; i < equity_curve.size(); ++i) {
            const double previous = equity_curve[i - 1].portfolio_value;
            // Portfolio value stays positive: cash never goes negative and prices are positive
            returns.push_back(previous > 0.0 ? equity_curve[i].portfolio_value / previous - 1.0 : 0.0);
        }
        return returns;
    }

    PerformanceReport MetricsCalculator::calculate(const core::EquityCurve& equity_curve,
                                                   const std::vector<core::Trade>& closed_trades,
                                                   int total_executions) const {
        auto logger = core::logging::getLogger();
        logger->info("Calculating performance metrics...");

        if (equity_curve.empty()) {
            throw core::InvalidInputException("equity_curve", "Cannot compute metrics on an empty equity curve.");
        }

        PerformanceReport report;
        report.total_executions = total_executions;

        // --- Return ---
        const double first_value = equity_curve.front().portfolio_value;
        const double last_value = equity_curve.back().portfolio_value;
        report.final_portfolio_value = last_value;
        report.total_return_pct = (first_value > 0.0) ? (last_value / first_value - 1.0) * 100.0 : 0.0;

        // --- Volatility and Sharpe ---
        const std::vector<double> returns = periodicReturns(equity_curve);
        const double periods = static_cast<double>(config_.periods_per_year);
        const double std_dev = sampleStdDev(returns);

        report.volatility_pct = std_dev * std::sqrt(periods) * 100.0;

        if (returns.size() >= 2 && std_dev > 0.0) {
            const double rf_per_period = config_.risk_free_rate / periods;
            report.sharpe_ratio = std::sqrt(periods) * (mean(returns) - rf_per_period) / std_dev;
        } else {
            report.sharpe_ratio = 0.0;
        }

        // --- Max Drawdown ---
        double peak = first_value;
        double max_drawdown = 0.0;
        for (const auto& point : equity_curve) {
            peak = std::max(peak, point.portfolio_value);
            if (peak > 0.0) {
                max_drawdown = std::min(max_drawdown, (point.portfolio_value - peak) / peak);
            }
        }
        report.max_drawdown_pct = max_drawdown * 100.0;

        // --- Trade-Based Metrics ---
        report.total_trades = static_cast<int>(closed_trades.size());
        double pnl_sum = 0.0;
        for (const auto& trade : closed_trades) {
            if (trade.pnl > 0.0) {
                report.winning_trades++;
            } else {
                report.losing_trades++; // Break-even counts as a loss
            }
            pnl_sum += trade.pnl;
        }

        if (report.total_trades > 0) {
            report.win_rate_pct = 100.0 * report.winning_trades / report.total_trades;
            report.avg_trade_pnl = pnl_sum / report.total_trades;
        }

        if (report.losing_trades > 0) {
            report.win_loss_ratio = static_cast<double>(report.winning_trades) / report.losing_trades;
        } else if (report.winning_trades > 0) {
            report.win_loss_ratio = std::numeric_limits<double>::infinity();
        } else {
            report.win_loss_ratio = 0.0;
        }

        logger->debug("Metrics computed over {} returns and {} closed trades.", returns.size(), closed_trades.size());
        return report;
    }

} // namespace backtester
