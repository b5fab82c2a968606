#include "csv_loader.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <spdlog/fmt/fmt.h>

#include <algorithm> // For std::sort, std::transform
#include <cctype>    // For std::tolower, std::isspace
#include <cmath>     // For std::llround
#include <fstream>   // For std::ifstream
#include <map>
#include <sstream>   // For std::stringstream

namespace data {

    namespace {

        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        // Whole-field numeric parse; trailing garbage is an error
        double parseNumber(const std::string& field, const char* column, size_t line_number) {
            size_t consumed = 0;
            double value = 0.0;
            try {
                value = std::stod(field, &consumed);
            } catch (const std::exception&) {
                consumed = 0;
            }
            if (consumed == 0 || consumed != field.size()) {
                throw core::DataLoadException(
                    fmt::format("Line {}: invalid {} value '{}'.", line_number, column, field));
            }
            return value;
        }

    } // namespace

    CsvPriceLoader::CsvPriceLoader(std::string file_path)
        : file_path_(std::move(file_path))
    {
        if (file_path_.empty()) {
            throw core::DataLoadException("CSV file path cannot be empty.");
        }
    }

    std::vector<std::string> CsvPriceLoader::split(const std::string& line, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, delimiter)) {
            tokens.push_back(trim(token));
        }
        return tokens;
    }

    std::string CsvPriceLoader::trim(const std::string& str) {
        const auto first = std::find_if_not(str.begin(), str.end(),
                                            [](unsigned char c) { return std::isspace(c); });
        const auto last = std::find_if_not(str.rbegin(), str.rend(),
                                           [](unsigned char c) { return std::isspace(c); }).base();
        return (first < last) ? std::string(first, last) : std::string();
    }

    core::PriceSeries CsvPriceLoader::load() const {
        auto logger = core::logging::getLogger();
        logger->info("Loading price data from CSV: {}", file_path_);

        std::ifstream file(file_path_);
        if (!file.is_open()) {
            throw core::DataLoadException(fmt::format("Failed to open CSV file: {}", file_path_));
        }

        // --- Header ---
        std::string line;
        size_t line_number = 0;
        std::map<std::string, size_t> columns;
        while (std::getline(file, line)) {
            ++line_number;
            if (trim(line).empty()) continue;
            std::vector<std::string> header = split(line);
            for (size_t i = 0; i < header.size(); ++i) {
                columns[toLower(header[i])] = i;
            }
            break;
        }

        const char* required[] = {"date", "open", "high", "low", "close", "volume"};
        for (const char* name : required) {
            if (columns.find(name) == columns.end()) {
                throw core::DataLoadException(
                    fmt::format("CSV file '{}' has no '{}' column in its header.", file_path_, name));
            }
        }
        const size_t date_col = columns["date"];
        const size_t open_col = columns["open"];
        const size_t high_col = columns["high"];
        const size_t low_col = columns["low"];
        const size_t close_col = columns["close"];
        const size_t volume_col = columns["volume"];
        size_t min_fields = 0;
        for (const auto& entry : columns) {
            min_fields = std::max(min_fields, entry.second + 1);
        }

        // --- Rows ---
        core::PriceSeries series;
        while (std::getline(file, line)) {
            ++line_number;
            if (trim(line).empty()) continue;

            std::vector<std::string> tokens = split(line);
            if (tokens.size() < min_fields) {
                throw core::DataLoadException(
                    fmt::format("Line {}: expected {} fields, got {}.", line_number, min_fields, tokens.size()));
            }

            core::PriceBar bar;
            try {
                bar.timestamp = core::utils::stringToTimestamp(tokens[date_col]);
            } catch (const std::runtime_error& e) {
                throw core::DataLoadException(fmt::format("Line {}: {}", line_number, e.what()));
            }
            bar.open = parseNumber(tokens[open_col], "Open", line_number);
            bar.high = parseNumber(tokens[high_col], "High", line_number);
            bar.low = parseNumber(tokens[low_col], "Low", line_number);
            bar.close = parseNumber(tokens[close_col], "Close", line_number);
            bar.volume = std::llround(parseNumber(tokens[volume_col], "Volume", line_number));
            series.push_back(bar);
        }

        if (series.empty()) {
            throw core::DataLoadException(fmt::format("CSV file '{}' contains no price rows.", file_path_));
        }

        std::sort(series.begin(), series.end());
        core::utils::validatePriceSeries(series);

        logger->info("Loaded {} bars from {} ({} to {}).", series.size(), file_path_,
                     core::utils::timestampToString(series.front().timestamp),
                     core::utils::timestampToString(series.back().timestamp));
        return series;
    }

} // namespace data
