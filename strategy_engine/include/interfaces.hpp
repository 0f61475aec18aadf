#pragma once

#include <string>
#include <optional>

#include "datatypes.hpp" // Provides TradingSignal, Indicators, SignalType

namespace strategy_engine {

    // What a confirmation check sees: the tentative direction and the
    // inputs it was derived from.
    struct ScoringContext {
        core::SignalType type = core::SignalType::Hold;
        core::Decimal price = 0;
        const core::Indicators* indicators = nullptr;
    };

    // Strength added by one confirmation and the text appended to the reason.
    struct ScoreAdjustment {
        double boost = 0.0;
        std::string reason_fragment;
    };

    // --- Score adjustment interface ---
    // One optional confirmation of a BUY/SELL signal (RSI extreme, band breach, ...).
    // Adjustments are applied in order and only when their indicator is present.
    class IScoreAdjustment {
    public:
        virtual ~IScoreAdjustment() = default;
        // Empty when the confirmation does not apply to this context
        virtual std::optional<ScoreAdjustment> evaluate(const ScoringContext& context) const = 0;
        virtual std::string describe() const = 0;
    };

} // namespace strategy_engine
