#pragma once

#include "interfaces.hpp"
#include "config.hpp"
#include "indicator_calculator.hpp"
#include <vector>
#include <memory>
#include <optional>

namespace strategy_engine {

    struct RiskLevels {
        core::Decimal stop_loss = 0;
        core::Decimal take_profit = 0;
    };

    // Mean-reversion decision policy: z-score of the current price against the
    // trailing SMA, confirmed by the configured score adjustments.
    class SignalEngine {
    public:
        // Strength floor below which a signal is not actionable
        static constexpr double kMinSignalStrength = 0.3;

        explicit SignalEngine(const core::EngineConfig& config);
        SignalEngine(const core::EngineConfig& config,
                     std::vector<std::unique_ptr<IScoreAdjustment>> adjustments);

        // Computes indicators over the window and evaluates its last bar.
        // Empty on insufficient data, low volume, zero variance or a weak signal.
        std::optional<core::TradingSignal> analyze(const core::TimeSeries<core::PriceBar>& window);

        std::optional<core::TradingSignal> generateSignal(const core::Decimal& price,
                                                          const core::Decimal& volume,
                                                          core::Timestamp timestamp,
                                                          const core::Indicators& indicators) const;

        // min(strength-based, risk-based, affordable with a 5% buffer), quantized down.
        core::Decimal calculatePositionSize(const core::TradingSignal& signal,
                                            const core::Decimal& available_balance,
                                            const core::Decimal& current_price) const;

        // Hold has no levels; it is treated like Buy.
        RiskLevels calculateRiskLevels(const core::Decimal& entry_price, core::SignalType type) const;

        const core::StrategyParams& getParams() const { return params_; }

    private:
        core::StrategyParams params_;
        core::Decimal max_position_size_;
        core::Decimal risk_per_trade_;
        indicators::IndicatorCalculator calculator_;
        std::vector<std::unique_ptr<IScoreAdjustment>> adjustments_;
    };

} // namespace strategy_engine
