#pragma once

#include <string>
#include <vector>

// Required project headers (use short paths)
#include "datatypes.hpp"
#include "config.hpp"
#include "price_provider.hpp"
#include "backtest_result.hpp"

namespace backtester {

    // Replays bars through the same SignalEngine and RiskManager used live,
    // against a simulated Portfolio. Each run starts from a clean ledger.
    class BacktestSimulator {
    public:
        explicit BacktestSimulator(const core::EngineConfig& config);

        // Loads the provider's history, keeps bars inside the configured
        // start/end window and replays them.
        // Throws DataLoadException when no bars remain.
        BacktestResult run(data::IPriceProvider& provider) const;

        // Replays an already loaded series as-is.
        BacktestResult run(const core::TimeSeries<core::PriceBar>& bars) const;

        const core::EngineConfig& getConfig() const { return config_; }

    private:
        core::EngineConfig config_;
    };

} // namespace backtester
