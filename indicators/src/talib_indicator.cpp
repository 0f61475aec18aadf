#include "talib_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "ta_libc.h"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace indicators {

    namespace {

        using LookbackFn = int (*)(int);
        using RoutineFn = TA_RetCode (*)(int, int, const double[], int, int*, int*, double[]);

        struct Routine {
            const char* label;
            LookbackFn lookback;
            RoutineFn run;
        };

        Routine routineFor(TaLibFunction function) {
            switch (function) {
                case TaLibFunction::Rsi: return Routine{"RSI", &TA_RSI_Lookback, &TA_RSI};
                case TaLibFunction::Ema: return Routine{"EMA", &TA_EMA_Lookback, &TA_EMA};
            }
            throw std::invalid_argument("Unknown TA-Lib function");
        }

    } // end anonymous namespace

    TaLibIndicator::TaLibIndicator(TaLibFunction function, int period)
        : function_(function), period_(period), lookback_(0)
    {
        Routine routine = routineFor(function_);
        if (period_ < 2) {
            throw std::invalid_argument(fmt::format("{} period must be at least 2, got {}", routine.label, period_));
        }
        lookback_ = routine.lookback(period_);
        if (lookback_ < 0) {
            throw core::IndicatorCalculationException(
                fmt::format("TA-Lib rejected {}({}) with lookback {}", routine.label, period_, lookback_));
        }
    }

    std::string TaLibIndicator::getName() const {
        return fmt::format("{}({})", routineFor(function_).label, period_);
    }

    int TaLibIndicator::getLookback() const {
        return lookback_;
    }

    const core::TimeSeries<double>& TaLibIndicator::getResult() const {
        return results_;
    }

    void TaLibIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
        results_.clear();
        if (input.size() <= static_cast<size_t>(lookback_)) {
            core::logging::getLogger()->trace("{} needs more than {} bars, have {}", getName(), lookback_, input.size());
            return;
        }

        std::vector<double> closes;
        closes.reserve(input.size());
        for (const auto& bar : input) {
            closes.push_back(core::decimal::toDouble(bar.close));
        }

        std::vector<double> output(closes.size() - static_cast<size_t>(lookback_));
        int out_begin = 0;
        int out_count = 0;
        TA_RetCode ret_code = routineFor(function_).run(
            0, static_cast<int>(closes.size()) - 1, closes.data(), period_, &out_begin, &out_count, output.data());

        if (ret_code != TA_SUCCESS) {
            throw core::IndicatorCalculationException(
                fmt::format("{} failed with TA-Lib code {}", getName(), static_cast<int>(ret_code)));
        }
        if (out_begin != lookback_ || out_count < 0 || static_cast<size_t>(out_count) != output.size()) {
            throw core::IndicatorCalculationException(
                fmt::format("{} produced {} values from bar {}, expected {} from bar {}",
                            getName(), out_count, out_begin, output.size(), lookback_));
        }
        for (double value : output) {
            if (!std::isfinite(value)) {
                throw core::IndicatorCalculationException(fmt::format("{} produced a non-finite value", getName()));
            }
        }
        results_ = std::move(output);
    }

    std::unique_ptr<IIndicator> makeRsi(int period) {
        return std::make_unique<TaLibIndicator>(TaLibFunction::Rsi, period);
    }

    std::unique_ptr<IIndicator> makeEma(int period) {
        return std::make_unique<TaLibIndicator>(TaLibFunction::Ema, period);
    }

} // namespace indicators
