#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <string>

namespace core {

    // Base-10 floating point with 50 significant digits. Expression templates are
    // disabled so the type behaves like a plain value (works with auto, std::min, etc.)
    using Decimal = boost::multiprecision::number<
        boost::multiprecision::cpp_dec_float<50>,
        boost::multiprecision::et_off>;

namespace decimal {

    // Parses "123.45", "-0.0025", "1e-3". Throws std::invalid_argument on bad input.
    Decimal fromString(const std::string& text);

    // Converts through the shortest round-trip text of the double, so 0.1 becomes
    // exactly 0.1 and not the nearest binary fraction.
    Decimal fromDouble(double value);

    double toDouble(const Decimal& value);

    // Fixed notation with exactly 'places' fractional digits.
    std::string toString(const Decimal& value, int places = 8);

    // Fixed notation, trailing zeros (and a dangling '.') removed.
    std::string toPlainString(const Decimal& value);

    // Truncates toward zero at 'places' fractional digits.
    Decimal quantizeDown(const Decimal& value, int places);

    Decimal sqrt(const Decimal& value);
    Decimal abs(const Decimal& value);

    inline const Decimal& min(const Decimal& a, const Decimal& b) { return (b < a) ? b : a; }
    inline const Decimal& max(const Decimal& a, const Decimal& b) { return (a < b) ? b : a; }

} // namespace decimal
} // namespace core
