// backtester/include/portfolio.hpp
#pragma once

#include <vector>
#include <optional>

#include "datatypes.hpp" // Provides core::Timestamp, core::Trade, core::EquityPoint

namespace backtester {

    // --- Portfolio Class ---
    // Cash/shares ledger of a single long-only instrument. Owned by one
    // simulation pass; every fill happens at the given price with a flat
    // commission rate charged on each leg.
    class Portfolio {
    public:
        Portfolio(double initial_capital, double commission_rate);

        // --- Getters ---
        double getCash() const { return cash_; }
        long long getShares() const { return shares_; }
        bool isLong() const { return shares_ > 0; }
        int getTotalExecutions() const { return execution_count_; }
        const std::vector<core::Trade>& getTradeLog() const { return trade_log_; }
        const std::optional<core::Trade>& getOpenTrade() const { return open_trade_; }

        // Value of the holdings at `price`, as an equity point
        core::EquityPoint markToMarket(core::Timestamp timestamp, double price) const;

        // --- Modifiers ---
        // Buys as many whole shares as the cash covers, commission included.
        // Returns false (no fill) when already long or not even one share is affordable.
        bool buy(core::Timestamp timestamp, double price);

        // Sells the whole position and appends the closed trade to the log.
        // Returns false when flat.
        bool sell(core::Timestamp timestamp, double price);

    private:
        double commission_rate_;
        double cash_;
        long long shares_ = 0;
        int execution_count_ = 0;
        std::optional<core::Trade> open_trade_;
        std::vector<core::Trade> trade_log_;
    };

} // namespace backtester
