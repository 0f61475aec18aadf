#include "signal_deduplicator.hpp"
#include "logging.hpp"

namespace strategy_engine {

SignalDeduplicator::SignalDeduplicator(std::chrono::seconds window) : window_(window) {}

bool SignalDeduplicator::shouldAct(const core::TradingSignal& signal) {
    if (signal.type == core::SignalType::Hold) {
        return false;
    }

    if (last_type_ && last_timestamp_ && *last_type_ == signal.type) {
        auto elapsed = signal.timestamp - *last_timestamp_;
        if (elapsed < core::Timestamp::duration::zero()) {
            elapsed = -elapsed;
        }
        if (elapsed < window_) {
            core::logging::getLogger()->debug("Ignoring duplicate {} signal", core::toString(signal.type));
            return false;
        }
    }

    last_type_ = signal.type;
    last_timestamp_ = signal.timestamp;
    return true;
}

void SignalDeduplicator::reset() {
    last_type_.reset();
    last_timestamp_.reset();
}

} // namespace strategy_engine
