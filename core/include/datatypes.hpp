#pragma once

#include <string>
#include <vector>
#include <chrono>   // For timestamps
#include <optional> // For undefined indicator values and open trades

namespace core {

    // Using system_clock for time points, all timestamps are UTC
    using Timestamp = std::chrono::system_clock::time_point;

    // Basic TimeSeries concept, indexed by bar position
    template<typename T>
    using TimeSeries = std::vector<T>;

    // A value per bar; empty while the producing indicator is still warming up
    using IndicatorSeries = TimeSeries<std::optional<double>>;


    struct PriceBar {
        Timestamp timestamp;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // Use long long for potentially large volumes

        bool operator<(const PriceBar& other) const {
            return timestamp < other.timestamp;
        }
    };

    using PriceSeries = TimeSeries<PriceBar>;

    enum class SignalAction {
        None,
        EnterLong,
        ExitLong
    };

    // Long-only position state
    enum class PositionState {
        Flat,
        Long
    };

    // A round trip. While the position is open the exit fields stay empty.
    struct Trade {
        Timestamp entry_time;
        double entry_price = 0.0;
        std::optional<Timestamp> exit_time;
        std::optional<double> exit_price;
        long long shares = 0;
        double commission = 0.0;    // Total commission (entry + exit)
        double pnl = 0.0;           // Realized PnL, net of both commissions
        double return_pct = 0.0;    // PnL / entry cost

        bool isOpen() const { return !exit_time.has_value(); }
    };

    struct EquityPoint {
        Timestamp timestamp;
        double cash = 0.0;
        long long shares_held = 0;
        double mark_price = 0.0;
        double portfolio_value = 0.0; // cash + shares_held * mark_price
    };

    using EquityCurve = TimeSeries<EquityPoint>;

    std::string toString(SignalAction action);
    std::string toString(PositionState state);

} // namespace core
