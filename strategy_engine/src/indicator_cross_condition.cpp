#include "indicator_cross_condition.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace strategy_engine {

IndicatorCrossCondition::IndicatorCrossCondition(IndicatorField field1,
                                                 CrossType cross_type,
                                                 IndicatorField field2)
    : field1_(field1),
      cross_type_(cross_type),
      field2_(field2)
{
    if (field1_ == field2_) {
        throw core::InvalidInputException("indicator2", "Cannot check cross condition for the same indicator.");
    }
}

bool IndicatorCrossCondition::evaluate(const MarketDataSnapshot& snapshot) const {
    std::optional<double> val1_now = snapshot.value(field1_);
    std::optional<double> val2_now = snapshot.value(field2_);
    std::optional<double> val1_prev = snapshot.previousValue(field1_);
    std::optional<double> val2_prev = snapshot.previousValue(field2_);

    if (!val1_now || !val2_now || !val1_prev || !val2_prev) {
        core::logging::getLogger()->trace("IndicatorCrossCondition: missing current or previous values ('{}', '{}') at bar {}.",
                                          toString(field1_), toString(field2_), snapshot.index);
        return false;
    }

    if (cross_type_ == CrossType::CrossesAbove) {
        // Was below or equal previously, AND is above now
        return (*val1_prev <= *val2_prev) && (*val1_now > *val2_now);
    }
    // Was above or equal previously, AND is below now
    return (*val1_prev >= *val2_prev) && (*val1_now < *val2_now);
}

std::string IndicatorCrossCondition::describe() const {
    return fmt::format("{} {} {}",
                       toString(field1_),
                       cross_type_ == CrossType::CrossesAbove ? "CrossesAbove" : "CrossesBelow",
                       toString(field2_));
}

} // namespace strategy_engine
