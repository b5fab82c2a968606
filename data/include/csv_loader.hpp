#pragma once

#include <string>
#include <vector>
#include "datatypes.hpp" // For core::PriceSeries

namespace data {

    // Loads an OHLCV price series from a CSV file with the header
    //   Date,Open,High,Low,Close,Volume
    // Columns are matched by name (case-insensitive), extra columns are ignored.
    // Dates are "YYYY-MM-DD" or ISO 8601 timestamps. Rows are returned sorted by
    // date; the series is validated with core::utils::validatePriceSeries.
    class CsvPriceLoader {
    public:
        explicit CsvPriceLoader(std::string file_path);

        // Throws core::DataLoadException if the file cannot be read or a row is
        // malformed, core::InvalidInputException if the resulting series is invalid.
        core::PriceSeries load() const;

        const std::string& getFilePath() const { return file_path_; }

        // Split one CSV line on commas, trimming each field
        static std::vector<std::string> split(const std::string& line, char delimiter = ',');
        static std::string trim(const std::string& str);

    private:
        std::string file_path_;
    };

} // namespace data
