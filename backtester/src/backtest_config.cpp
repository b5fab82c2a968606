#include "backtest_config.hpp"
#include "config_json.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath> // For std::isfinite

namespace backtester {

void BacktestConfig::validate() const {
    if (!std::isfinite(initial_capital) || initial_capital <= 0.0) {
        throw core::InvalidInputException("initial_capital",
            fmt::format("initial_capital must be positive, got {}.", initial_capital));
    }
    if (!std::isfinite(commission_rate) || commission_rate < 0.0 || commission_rate >= 1.0) {
        throw core::InvalidInputException("commission_rate",
            fmt::format("commission_rate must lie in [0, 1), got {}.", commission_rate));
    }
    if (!std::isfinite(risk_free_rate)) {
        throw core::InvalidInputException("risk_free_rate", "risk_free_rate must be finite.");
    }
    if (periods_per_year <= 0) {
        throw core::InvalidInputException("periods_per_year",
            fmt::format("periods_per_year must be positive, got {}.", periods_per_year));
    }
}

BacktestConfig BacktestConfig::fromJson(const json& node) {
    namespace cj = strategy_engine::config_json;
    cj::requireObject(node, "Backtest config");

    BacktestConfig config;
    cj::readDouble(node, "initial_capital", config.initial_capital);
    cj::readDouble(node, "commission_rate", config.commission_rate);
    cj::readDouble(node, "risk_free_rate", config.risk_free_rate);
    cj::readInt(node, "periods_per_year", config.periods_per_year);
    cj::readBool(node, "liquidate_at_end", config.liquidate_at_end);

    config.validate();
    return config;
}

} // namespace backtester
