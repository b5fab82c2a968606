#include "portfolio.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"
#include <cmath> // For std::floor

namespace backtester {

    Portfolio::Portfolio(double initial_capital, double commission_rate)
        : commission_rate_(commission_rate), cash_(initial_capital) {
        if (!(initial_capital > 0.0)) {
            throw core::InvalidInputException("initial_capital", "Initial capital must be positive.");
        }
        if (!(commission_rate >= 0.0 && commission_rate < 1.0)) {
            throw core::InvalidInputException("commission_rate", "Commission rate must lie in [0, 1).");
        }
    }

    core::EquityPoint Portfolio::markToMarket(core::Timestamp timestamp, double price) const {
        core::EquityPoint point;
        point.timestamp = timestamp;
        point.cash = cash_;
        point.shares_held = shares_;
        point.mark_price = price;
        point.portfolio_value = cash_ + static_cast<double>(shares_) * price;
        return point;
    }

    bool Portfolio::buy(core::Timestamp timestamp, double price) {
        auto logger = core::logging::getLogger();
        if (isLong()) {
            logger->warn("Cannot EnterLong while already long. Ignoring.");
            return false;
        }

        const double unit_cost = price * (1.0 + commission_rate_);
        long long quantity = static_cast<long long>(std::floor(cash_ / unit_cost));
        // Rounding in the division must never let the cost exceed the cash
        while (quantity > 0 && static_cast<double>(quantity) * unit_cost > cash_) {
            --quantity;
        }
        if (quantity <= 0) {
            logger->info("Insufficient cash for a single share at {:.2f} (cash {:.2f}). Buy skipped.", price, cash_);
            return false;
        }

        const double cost = static_cast<double>(quantity) * unit_cost;
        cash_ -= cost;
        shares_ = quantity;
        execution_count_++;

        core::Trade trade;
        trade.entry_time = timestamp;
        trade.entry_price = price;
        trade.shares = quantity;
        trade.commission = static_cast<double>(quantity) * price * commission_rate_;
        open_trade_ = trade;

        logger->info("BUY  {} shares @ {:.2f} on {}, cost {:.2f}, cash left {:.2f}",
                     quantity, price, core::utils::timestampToString(timestamp), cost, cash_);
        return true;
    }

    bool Portfolio::sell(core::Timestamp timestamp, double price) {
        auto logger = core::logging::getLogger();
        if (!isLong() || !open_trade_) {
            logger->warn("Cannot ExitLong if not long. Ignoring.");
            return false;
        }

        const double quantity = static_cast<double>(shares_);
        const double proceeds = quantity * price * (1.0 - commission_rate_);
        const double entry_cost = quantity * open_trade_->entry_price * (1.0 + commission_rate_);

        cash_ += proceeds;
        shares_ = 0;
        execution_count_++;

        core::Trade trade = *open_trade_;
        trade.exit_time = timestamp;
        trade.exit_price = price;
        trade.commission += quantity * price * commission_rate_;
        trade.pnl = proceeds - entry_cost;
        trade.return_pct = (entry_cost > 0.0) ? trade.pnl / entry_cost : 0.0;
        trade_log_.push_back(trade);
        open_trade_.reset();

        logger->info("SELL {} shares @ {:.2f} on {}, proceeds {:.2f}, PnL {:.2f}",
                     trade.shares, price, core::utils::timestampToString(timestamp), proceeds, trade.pnl);
        return true;
    }

} // namespace backtester
