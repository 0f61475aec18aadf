#pragma once

#include "config.hpp"
#include "price_provider.hpp"
#include "execution_sink.hpp"
#include "metrics_sink.hpp"
#include "signal_engine.hpp"
#include "signal_deduplicator.hpp"
#include "risk_manager.hpp"
#include <optional>

namespace live {

    // One fetch-analyze-validate-execute pass per call. Scheduling is the host's job.
    class TradingCycle {
    public:
        // Provider, sink and metrics sink must outlive the cycle. metrics may be null.
        TradingCycle(const core::EngineConfig& config,
                     data::IPriceProvider& provider,
                     IExecutionSink& sink,
                     IMetricsSink* metrics = nullptr,
                     risk::Clock clock = {});

        // False when the cycle aborted on an exception. A skipped cycle
        // (not enough history) still returns true.
        bool runOnce();

        // Closes every open position through the sink. Returns how many were closed.
        int shutdown();

        const risk::RiskManager& getRiskManager() const { return risk_manager_; }
        const strategy_engine::SignalDeduplicator& getDeduplicator() const { return deduplicator_; }
        long long getCompletedCycles() const { return completed_cycles_; }

    private:
        core::EngineConfig config_;
        data::IPriceProvider& provider_;
        IExecutionSink& sink_;
        IMetricsSink* metrics_;
        risk::Clock clock_;
        strategy_engine::SignalEngine engine_;
        risk::RiskManager risk_manager_;
        strategy_engine::SignalDeduplicator deduplicator_;
        long long completed_cycles_ = 0;

        core::Timestamp now() const;
        void handleSignal(const core::TradingSignal& signal);
        void managePositions(const core::Decimal& current_price);
        void trackRealizedLoss(const core::Trade& trade);

        void publishSignal(const core::TradingSignal& signal);
        void publishTrade(const core::Trade& trade);
        void publishRiskMetrics();
    };

} // namespace live
