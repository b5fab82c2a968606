#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For std::istringstream
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow, std::isfinite, std::round
#include <cctype>     // For std::isdigit
#include <ctime>      // For timegm

namespace core {

    std::string toString(SignalAction action) {
        switch (action) {
            case SignalAction::None:      return "None";
            case SignalAction::EnterLong: return "EnterLong";
            case SignalAction::ExitLong:  return "ExitLong";
            default:                      return "UnknownAction";
        }
    }

    std::string toString(PositionState state) {
        return state == PositionState::Long ? "LONG" : "FLAT";
    }

namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse the date, then the optional time part
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date part): " + iso_string);
        }
        if (ss.peek() == 'T' || ss.peek() == ' ') {
            ss.ignore();
            ss >> std::get_time(&tm, "%H:%M:%S");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse timestamp (time part): " + iso_string);
            }
        }

        // 2. Manually parse optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            int digit_count = 0;
            while (std::isdigit(ss.peek()) && digit_count < 9) { // Limit precision to nanoseconds
                digits += static_cast<char>(ss.get());
                digit_count++;
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Parse optional timezone offset (+HH:MM, -HH:MM, or Z). Absent means UTC.
        std::chrono::seconds offset_duration = std::chrono::seconds(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        }

        // 4. Convert tm to time_t, interpreting the fields as UTC
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2024-01-02T00:00:00+05:30 is 2024-01-01T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #elif defined(__unix__) || defined(__APPLE__)
            gmtime_r(&tt, &time_tm);
        #else
            std::tm* temp_tm = std::gmtime(&tt);
            if (!temp_tm) {
                throw std::runtime_error("Failed to get gmtime representation for timestamp.");
            }
            time_tm = *temp_tm;
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    void validatePriceSeries(const PriceSeries& series) {
        if (series.empty()) {
            throw InvalidInputException("price_series", "Price series is empty.");
        }

        for (size_t i = 0; i < series.size(); ++i) {
            const PriceBar& bar = series[i];
            const double prices[] = {bar.open, bar.high, bar.low, bar.close};
            for (double price : prices) {
                if (!std::isfinite(price) || price <= 0.0) {
                    std::ostringstream msg;
                    msg << "Non-positive or non-finite price " << price << " in bar " << i
                        << " (" << timestampToString(bar.timestamp) << ").";
                    throw InvalidInputException("price", msg.str());
                }
            }
            if (i > 0 && !(series[i - 1].timestamp < bar.timestamp)) {
                std::ostringstream msg;
                msg << "Timestamps must be strictly increasing: bar " << i
                    << " (" << timestampToString(bar.timestamp) << ") does not follow bar " << i - 1
                    << " (" << timestampToString(series[i - 1].timestamp) << ").";
                throw InvalidInputException("timestamp", msg.str());
            }
        }
    }

    double roundTo(double value, int decimals) {
        if (!std::isfinite(value)) {
            return value;
        }
        const double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }

} // namespace utils
} // namespace core
