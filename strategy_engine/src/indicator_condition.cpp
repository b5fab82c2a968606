#include "indicator_condition.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath> // For std::fabs, std::isfinite

namespace strategy_engine {

IndicatorCondition::IndicatorCondition(IndicatorField lhs, ComparisonOp op, double value)
    : lhs_(lhs), op_(op), rhs_(value)
{
    if (!std::isfinite(value)) {
        throw core::InvalidInputException("value", "IndicatorCondition threshold must be finite.");
    }
}

IndicatorCondition::IndicatorCondition(IndicatorField lhs, ComparisonOp op, IndicatorField rhs)
    : lhs_(lhs), op_(op), rhs_(rhs)
{
    if (lhs_ == rhs) {
        throw core::InvalidInputException("indicator2", "Cannot compare an indicator to itself in IndicatorCondition.");
    }
}

bool IndicatorCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    std::optional<double> lhs_value = snapshot.value(lhs_);
    std::optional<double> rhs_value;
    if (const double* fixed = std::get_if<double>(&rhs_)) {
        rhs_value = *fixed;
    } else {
        rhs_value = snapshot.value(std::get<IndicatorField>(rhs_));
    }

    if (!lhs_value || !rhs_value) {
        core::logging::getLogger()->trace("IndicatorCondition '{}' undefined at bar {}.", describe(), snapshot.index);
        return false;
    }

    switch (op_) {
        case ComparisonOp::GT:  return *lhs_value > *rhs_value;
        case ComparisonOp::LT:  return *lhs_value < *rhs_value;
        case ComparisonOp::GTE: return *lhs_value >= *rhs_value;
        case ComparisonOp::LTE: return *lhs_value <= *rhs_value;
        case ComparisonOp::EQ:
            // Use tolerance for floating point equality
            return std::fabs(*lhs_value - *rhs_value) < 1e-9;
    }
    return false;
}

std::string IndicatorCondition::describe() const {
    if (const double* fixed = std::get_if<double>(&rhs_)) {
        return fmt::format("{} {} {}", toString(lhs_), toString(op_), *fixed);
    }
    return fmt::format("{} {} {}", toString(lhs_), toString(op_), toString(std::get<IndicatorField>(rhs_)));
}

} // namespace strategy_engine
