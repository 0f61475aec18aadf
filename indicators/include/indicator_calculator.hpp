#pragma once

#include "datatypes.hpp"
#include "config.hpp"
#include "talib_indicator.hpp"
#include <optional>
#include <memory>

namespace indicators {

    // Computes the mean-reversion indicator set from a trailing window.
    // SMA, population standard deviation and bands are exact decimals over the
    // last ma_period closes; RSI and EMA come from TA-Lib over the whole window.
    class IndicatorCalculator {
    public:
        explicit IndicatorCalculator(const core::StrategyParams& params);

        // Empty when the window holds fewer than ma_period bars.
        std::optional<core::Indicators> calculate(const core::TimeSeries<core::PriceBar>& window);
        std::optional<core::Indicators> calculate(const core::TimeSeries<core::Decimal>& closes);

        int getMaPeriod() const { return ma_period_; }

    private:
        int ma_period_;
        core::Decimal std_dev_multiplier_;
        int rsi_period_;
        int ema_period_;
        std::unique_ptr<IIndicator> rsi_;
        std::unique_ptr<IIndicator> ema_;

        // Last value of an indicator run over the window, if the window was long enough.
        static std::optional<double> lastValue(IIndicator& indicator,
                                               const core::TimeSeries<core::PriceBar>& window,
                                               int min_bars);
    };

    // Population standard deviation (divides by N).
    core::Decimal populationStdDev(const std::vector<core::Decimal>& values, const core::Decimal& mean);

} // namespace indicators
