#include "indicator_calculator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <stdexcept>

namespace indicators {

    core::Decimal populationStdDev(const std::vector<core::Decimal>& values, const core::Decimal& mean) {
        if (values.empty()) {
            return core::Decimal(0);
        }
        core::Decimal sum_sq = 0;
        for (const auto& v : values) {
            core::Decimal diff = v - mean;
            sum_sq += diff * diff;
        }
        core::Decimal variance = sum_sq / core::Decimal(static_cast<long long>(values.size()));
        return core::decimal::sqrt(variance);
    }

    IndicatorCalculator::IndicatorCalculator(const core::StrategyParams& params)
        : ma_period_(params.ma_period),
          std_dev_multiplier_(params.std_dev_multiplier),
          rsi_period_(params.rsi_period),
          ema_period_(params.ema_period),
          rsi_(makeRsi(params.rsi_period)),
          ema_(makeEma(params.ema_period))
    {
        if (ma_period_ < 2) {
            throw std::invalid_argument("Moving average period must be at least 2.");
        }
    }

    std::optional<double> IndicatorCalculator::lastValue(IIndicator& indicator,
                                                         const core::TimeSeries<core::PriceBar>& window,
                                                         int min_bars) {
        if (window.size() < static_cast<size_t>(min_bars)) {
            return std::nullopt;
        }
        indicator.calculate(window);
        const auto& result = indicator.getResult();
        if (result.empty()) {
            return std::nullopt;
        }
        return result.back();
    }

    std::optional<core::Indicators> IndicatorCalculator::calculate(const core::TimeSeries<core::PriceBar>& window) {
        auto logger = core::logging::getLogger();
        if (window.size() < static_cast<size_t>(ma_period_)) {
            logger->debug("Insufficient data for indicators. Need {} bars, have {}", ma_period_, window.size());
            return std::nullopt;
        }

        std::vector<core::Decimal> recent;
        recent.reserve(ma_period_);
        for (size_t i = window.size() - ma_period_; i < window.size(); ++i) {
            recent.push_back(window[i].close);
        }

        core::Decimal sum = 0;
        for (const auto& c : recent) {
            sum += c;
        }

        core::Indicators result;
        result.sma = sum / core::Decimal(ma_period_);
        result.std_dev = populationStdDev(recent, result.sma);
        result.upper_band = result.sma + result.std_dev * std_dev_multiplier_;
        result.lower_band = result.sma - result.std_dev * std_dev_multiplier_;
        if (result.std_dev > 0) {
            result.z_score = (window.back().close - result.sma) / result.std_dev;
        }

        // Confirmation inputs. A TA-Lib failure drops the value, never the indicator set.
        try {
            result.rsi = lastValue(*rsi_, window, rsi_period_);
        } catch (const core::IndicatorCalculationException& e) {
            logger->warn("RSI unavailable: {}", e.what());
        }
        try {
            result.ema = lastValue(*ema_, window, ema_period_);
        } catch (const core::IndicatorCalculationException& e) {
            logger->warn("EMA unavailable: {}", e.what());
        }

        return result;
    }

    std::optional<core::Indicators> IndicatorCalculator::calculate(const core::TimeSeries<core::Decimal>& closes) {
        core::TimeSeries<core::PriceBar> window;
        window.reserve(closes.size());
        for (const auto& c : closes) {
            core::PriceBar bar;
            bar.open = bar.high = bar.low = bar.close = c;
            window.push_back(bar);
        }
        return calculate(window);
    }

} // namespace indicators
