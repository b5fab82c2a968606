#include "indicators.hpp"
#include "exceptions.hpp"
#include <spdlog/fmt/fmt.h>

namespace indicators {

std::vector<double> closePrices(const core::PriceSeries& series) {
    std::vector<double> close_prices;
    close_prices.reserve(series.size());
    for (const auto& bar : series) {
        close_prices.push_back(bar.close);
    }
    return close_prices;
}

void requireWindow(const std::string& field, int window, int minimum) {
    if (window < minimum) {
        throw core::InvalidInputException(field,
            fmt::format("{} must be at least {}, got {}.", field, minimum, window));
    }
}

void alignOutput(const std::vector<double>& out, int out_begin_idx, int out_nb_element,
                 core::IndicatorSeries& result) {
    for (int i = 0; i < out_nb_element; ++i) {
        size_t target = static_cast<size_t>(out_begin_idx + i);
        if (target >= result.size() || static_cast<size_t>(i) >= out.size()) {
            break;
        }
        result[target] = out[static_cast<size_t>(i)];
    }
}

} // namespace indicators
