#pragma once

#include "datatypes.hpp" // Needs PriceBar, TimeSeries
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "EMA(20)", "RSI(14)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output.
    virtual int getLookback() const = 0;

    // Calculate over the closing prices of the input and store the result internally.
    virtual void calculate(const core::TimeSeries<core::PriceBar>& input) = 0;

    // Result series, aligned to the end of the input: element i belongs to
    // input[i + getLookback()]. Empty when the input was too short.
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
