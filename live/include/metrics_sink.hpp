#pragma once

#include "datatypes.hpp"
#include "risk_manager.hpp"

namespace live {

    // Observer for what a cycle produced. Failures here never stop trading.
    class IMetricsSink {
    public:
        virtual ~IMetricsSink() = default;

        virtual void onSignal(const core::TradingSignal& signal) = 0;
        virtual void onTrade(const core::Trade& trade) = 0;
        virtual void onRiskMetrics(const risk::RiskMetrics& metrics) = 0;
    };

    // Writes to the signal, trade and metric log channels.
    class LoggingMetricsSink : public IMetricsSink {
    public:
        void onSignal(const core::TradingSignal& signal) override;
        void onTrade(const core::Trade& trade) override;
        void onRiskMetrics(const risk::RiskMetrics& metrics) override;
    };

} // namespace live
