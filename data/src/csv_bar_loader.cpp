#include "csv_bar_loader.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace data {

    namespace {

        std::string trim(const std::string& s) {
            size_t begin = 0;
            size_t end = s.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
            return s.substr(begin, end - begin);
        }

        std::vector<std::string> splitFields(const std::string& line) {
            std::vector<std::string> fields;
            std::stringstream line_stream(line);
            std::string field;
            while (std::getline(line_stream, field, ',')) {
                fields.push_back(trim(field));
            }
            return fields;
        }

        bool isUnixMillis(const std::string& text) {
            return !text.empty() &&
                   std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
        }

        bool isHeader(const std::string& line) {
            std::string first = trim(line.substr(0, line.find(',')));
            std::transform(first.begin(), first.end(), first.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return first == "timestamp" || first == "time" || first == "date";
        }

    } // end anonymous namespace

    core::PriceBar CsvBarLoader::parseLine(const std::string& line, const std::string& source) {
        std::vector<std::string> fields = splitFields(line);
        if (fields.size() != 6) {
            throw std::invalid_argument("expected 6 fields, got " + std::to_string(fields.size()));
        }

        core::PriceBar bar;
        bar.timestamp = isUnixMillis(fields[0])
                            ? core::utils::fromUnixMillis(std::stoll(fields[0]))
                            : core::utils::stringToTimestamp(fields[0]);
        bar.open = core::decimal::fromString(fields[1]);
        bar.high = core::decimal::fromString(fields[2]);
        bar.low = core::decimal::fromString(fields[3]);
        bar.close = core::decimal::fromString(fields[4]);
        bar.volume = core::decimal::fromString(fields[5]);
        bar.source = source;

        if (bar.close <= 0 || bar.open <= 0 || bar.high <= 0 || bar.low <= 0) {
            throw std::invalid_argument("prices must be positive");
        }
        if (bar.volume < 0) {
            throw std::invalid_argument("volume must not be negative");
        }
        if (bar.high < bar.low) {
            throw std::invalid_argument("high is below low");
        }
        return bar;
    }

    core::TimeSeries<core::PriceBar> CsvBarLoader::load(std::istream& input, const std::string& source) {
        auto logger = core::logging::getLogger();
        core::TimeSeries<core::PriceBar> bars;

        std::string line;
        size_t line_number = 0;
        size_t skipped = 0;
        bool seen_data = false;
        while (std::getline(input, line)) {
            ++line_number;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (trim(line).empty()) {
                continue;
            }
            if (!seen_data && isHeader(line)) {
                seen_data = true;
                continue;
            }
            seen_data = true;

            try {
                bars.push_back(parseLine(line, source));
            } catch (const std::exception& e) {
                // std::stoll throws out_of_range, the parsers throw invalid_argument
                ++skipped;
                logger->warn("Skipping invalid CSV line {}: {}", line_number, e.what());
            }
        }

        std::stable_sort(bars.begin(), bars.end());
        logger->info("Loaded {} bars from CSV ({} lines skipped)", bars.size(), skipped);
        return bars;
    }

    core::TimeSeries<core::PriceBar> CsvBarLoader::load(const std::string& path, const std::string& source) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw core::DataLoadException("Cannot open CSV file: " + path);
        }
        core::logging::getLogger()->info("Reading price bars from {}", path);
        return load(file, source);
    }

} // namespace data
