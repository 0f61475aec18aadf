#include "score_adjustments.hpp"
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace strategy_engine {

// --- RsiConfirmation ---

RsiConfirmation::RsiConfirmation(double oversold, double overbought, double boost)
    : oversold_(oversold), overbought_(overbought), boost_(boost)
{
    if (oversold_ >= overbought_) {
        throw std::invalid_argument("RSI oversold level must be below the overbought level.");
    }
}

std::optional<ScoreAdjustment> RsiConfirmation::evaluate(const ScoringContext& context) const {
    if (!context.indicators || !context.indicators->rsi) {
        return std::nullopt;
    }
    double rsi = *context.indicators->rsi;
    if (context.type == core::SignalType::Buy && rsi < oversold_) {
        return ScoreAdjustment{boost_, "RSI oversold"};
    }
    if (context.type == core::SignalType::Sell && rsi > overbought_) {
        return ScoreAdjustment{boost_, "RSI overbought"};
    }
    return std::nullopt;
}

std::string RsiConfirmation::describe() const {
    return fmt::format("RSI < {} (BUY) or > {} (SELL): +{}", oversold_, overbought_, boost_);
}

// --- BollingerConfirmation ---

BollingerConfirmation::BollingerConfirmation(double boost) : boost_(boost) {}

std::optional<ScoreAdjustment> BollingerConfirmation::evaluate(const ScoringContext& context) const {
    if (!context.indicators) {
        return std::nullopt;
    }
    if (context.type == core::SignalType::Buy && context.price < context.indicators->lower_band) {
        return ScoreAdjustment{boost_, "price below lower Bollinger Band"};
    }
    if (context.type == core::SignalType::Sell && context.price > context.indicators->upper_band) {
        return ScoreAdjustment{boost_, "price above upper Bollinger Band"};
    }
    return std::nullopt;
}

std::string BollingerConfirmation::describe() const {
    return fmt::format("Price outside Bollinger Band: +{}", boost_);
}

// --- EmaCounterTrendConfirmation ---

EmaCounterTrendConfirmation::EmaCounterTrendConfirmation(double boost) : boost_(boost) {}

std::optional<ScoreAdjustment> EmaCounterTrendConfirmation::evaluate(const ScoringContext& context) const {
    if (!context.indicators || !context.indicators->ema) {
        return std::nullopt;
    }
    core::Decimal ema = core::decimal::fromDouble(*context.indicators->ema);
    bool bullish = context.price > ema;
    if (context.type == core::SignalType::Buy && !bullish) {
        return ScoreAdjustment{boost_, "counter-trend below EMA"};
    }
    if (context.type == core::SignalType::Sell && bullish) {
        return ScoreAdjustment{boost_, "counter-trend above EMA"};
    }
    return std::nullopt;
}

std::string EmaCounterTrendConfirmation::describe() const {
    return fmt::format("Signal against EMA trend: +{}", boost_);
}

std::vector<std::unique_ptr<IScoreAdjustment>> defaultScoreAdjustments() {
    std::vector<std::unique_ptr<IScoreAdjustment>> adjustments;
    adjustments.push_back(std::make_unique<RsiConfirmation>());
    adjustments.push_back(std::make_unique<BollingerConfirmation>());
    adjustments.push_back(std::make_unique<EmaCounterTrendConfirmation>());
    return adjustments;
}

} // namespace strategy_engine
