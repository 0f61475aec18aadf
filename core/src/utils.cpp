#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow
#include <cctype>
#include <ctime>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // Date-only strings ("2024-03-01") are taken as UTC midnight
        if (iso_string.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse date: " + iso_string);
            }
            time_t tt = timegm(&tm);
            if (tt == (time_t)-1) {
                throw std::runtime_error("Failed to convert date to UTC epoch seconds: " + iso_string);
            }
            return std::chrono::system_clock::from_time_t(tt);
        }

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Manually parse optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            int digit_count = 0;
            while (std::isdigit(ss.peek()) && digit_count < 9) {
                digits += static_cast<char>(ss.get());
                digit_count++;
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, digits.length());
            }
        }

        // 3. Manually parse timezone offset (+HH:MM, -HH:MM, or Z)
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
        } else {
             throw std::runtime_error("Timestamp missing or invalid timezone offset/indicator: " + iso_string);
        }

        // 4. timegm interprets struct tm as UTC; the offset is applied afterwards
        time_t tt = timegm(&tm);
        if (tt == (time_t)-1) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(fractional_seconds));

        // 2015-04-20T00:00:00+05:30 is 2015-04-19T18:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm time_tm;
        gmtime_r(&tt, &time_tm);

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    Timestamp fromUnixMillis(std::int64_t millis) {
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::milliseconds(millis)));
    }

    std::int64_t toUnixMillis(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    }

    Timestamp localDayStart(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        std::tm local_tm;
        localtime_r(&tt, &local_tm);
        local_tm.tm_hour = 0;
        local_tm.tm_min = 0;
        local_tm.tm_sec = 0;
        local_tm.tm_isdst = -1; // Let mktime resolve DST for midnight itself
        time_t midnight = std::mktime(&local_tm);
        if (midnight == (time_t)-1) {
            throw std::runtime_error("Failed to compute local midnight for " + timestampToString(ts));
        }
        return std::chrono::system_clock::from_time_t(midnight);
    }

} // namespace utils
} // namespace core
