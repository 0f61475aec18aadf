#pragma once

#include "datatypes.hpp"
#include <chrono>
#include <optional>

namespace strategy_engine {

    // Cycle-to-cycle memory of the last acted-on signal. Owned by the orchestrator.
    class SignalDeduplicator {
    public:
        explicit SignalDeduplicator(std::chrono::seconds window = std::chrono::minutes(5));

        // False when the signal repeats the last type within the window.
        // Otherwise remembers it and returns true. Hold never counts as acted on.
        bool shouldAct(const core::TradingSignal& signal);

        void reset();

        std::optional<core::SignalType> lastType() const { return last_type_; }
        std::optional<core::Timestamp> lastTimestamp() const { return last_timestamp_; }

    private:
        std::chrono::seconds window_;
        std::optional<core::SignalType> last_type_;
        std::optional<core::Timestamp> last_timestamp_;
    };

} // namespace strategy_engine
