#pragma once

#include "datatypes.hpp"
#include <istream>
#include <string>

namespace data {

    // Reads timestamp,open,high,low,close,volume rows. A leading header row is
    // optional. Timestamps are ISO 8601 or unix milliseconds. Invalid rows are
    // skipped with a warning; the result is sorted by timestamp.
    class CsvBarLoader {
    public:
        // Throws DataLoadException if the file cannot be opened
        static core::TimeSeries<core::PriceBar> load(const std::string& path, const std::string& source = "csv");
        static core::TimeSeries<core::PriceBar> load(std::istream& input, const std::string& source = "csv");

        // Parses one data row. Throws std::invalid_argument on malformed input.
        static core::PriceBar parseLine(const std::string& line, const std::string& source);
    };

} // namespace data
