#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>
#include <cstdint>

namespace core {
namespace utils {

    // ISO 8601 in UTC, e.g. 2024-03-01T14:00:00Z
    std::string timestampToString(const Timestamp& ts);

    // Parses ISO 8601 with a 'Z' or +HH:MM / -HH:MM suffix
    Timestamp stringToTimestamp(const std::string& iso_string);

    Timestamp fromUnixMillis(std::int64_t millis);
    std::int64_t toUnixMillis(const Timestamp& ts);

    // Local midnight of the calendar day containing ts
    Timestamp localDayStart(const Timestamp& ts);

} // namespace utils
} // namespace core
