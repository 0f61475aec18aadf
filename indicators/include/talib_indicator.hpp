#pragma once

#include "indicators.hpp"
#include <memory>
#include <string>

namespace indicators {

    // Single-input TA-Lib routines used as signal confirmations
    enum class TaLibFunction { Rsi, Ema };

    // Runs one TA-Lib routine over the closes of a window.
    // A TA-Lib error, a result not aligned to the end of the input, or a
    // non-finite value raises IndicatorCalculationException and leaves the
    // result empty.
    class TaLibIndicator : public IIndicator {
    public:
        TaLibIndicator(TaLibFunction function, int period);

        std::string getName() const override;
        int getLookback() const override;
        void calculate(const core::TimeSeries<core::PriceBar>& input) override;
        const core::TimeSeries<double>& getResult() const override;

        TaLibFunction getFunction() const { return function_; }
        int getPeriod() const { return period_; }

    private:
        TaLibFunction function_;
        int period_;
        int lookback_;
        core::TimeSeries<double> results_;
    };

    std::unique_ptr<IIndicator> makeRsi(int period);
    std::unique_ptr<IIndicator> makeEma(int period);

} // namespace indicators
