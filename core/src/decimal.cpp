#include "decimal.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept>
#include <algorithm>
#include <cctype>

namespace core {
namespace decimal {

    Decimal fromString(const std::string& text) {
        std::string trimmed = text;
        trimmed.erase(trimmed.begin(), std::find_if(trimmed.begin(), trimmed.end(),
                      [](unsigned char c) { return !std::isspace(c); }));
        trimmed.erase(std::find_if(trimmed.rbegin(), trimmed.rend(),
                      [](unsigned char c) { return !std::isspace(c); }).base(), trimmed.end());
        if (trimmed.empty()) {
            throw std::invalid_argument("Cannot parse decimal from empty string.");
        }
        Decimal value;
        try {
            value = Decimal(trimmed);
        } catch (const std::runtime_error& e) {
            throw std::invalid_argument(fmt::format("Invalid decimal '{}': {}", text, e.what()));
        }
        if (!boost::multiprecision::isfinite(value)) {
            throw std::invalid_argument(fmt::format("Decimal '{}' is not finite", text));
        }
        return value;
    }

    Decimal fromDouble(double value) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Cannot convert non-finite double to decimal.");
        }
        // fmt's default presentation is the shortest text that round-trips
        return Decimal(fmt::format("{}", value));
    }

    double toDouble(const Decimal& value) {
        return value.convert_to<double>();
    }

    std::string toString(const Decimal& value, int places) {
        return value.str(places, std::ios_base::fixed);
    }

    std::string toPlainString(const Decimal& value) {
        std::string s = value.str(20, std::ios_base::fixed);
        if (s.find('.') != std::string::npos) {
            while (!s.empty() && s.back() == '0') s.pop_back();
            if (!s.empty() && s.back() == '.') s.pop_back();
        }
        if (s == "-0") s = "0";
        return s;
    }

    Decimal quantizeDown(const Decimal& value, int places) {
        if (places < 0 || places > 18) {
            throw std::invalid_argument(fmt::format("Unsupported decimal places: {}", places));
        }
        unsigned long long scale = 1;
        for (int i = 0; i < places; ++i) scale *= 10ULL;
        // Integer multiply/divide are exact limb operations for cpp_dec_float
        Decimal scaled = boost::multiprecision::trunc(value * scale);
        return scaled / scale;
    }

    Decimal sqrt(const Decimal& value) {
        if (value < 0) {
            throw std::domain_error("Square root of negative decimal.");
        }
        return boost::multiprecision::sqrt(value);
    }

    Decimal abs(const Decimal& value) {
        return boost::multiprecision::abs(value);
    }

} // namespace decimal
} // namespace core
