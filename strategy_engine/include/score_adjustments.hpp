#pragma once

#include "interfaces.hpp"
#include <vector>
#include <memory>
#include <string>

namespace strategy_engine {

    // RSI below the oversold level confirms a BUY, above the overbought level a SELL.
    class RsiConfirmation : public IScoreAdjustment {
    public:
        RsiConfirmation(double oversold = 30.0, double overbought = 70.0, double boost = 0.2);
        virtual ~RsiConfirmation() override = default;

        std::optional<ScoreAdjustment> evaluate(const ScoringContext& context) const override;
        std::string describe() const override;

    private:
        double oversold_;
        double overbought_;
        double boost_;
    };

    // Price beyond the Bollinger band on the side of the signal.
    class BollingerConfirmation : public IScoreAdjustment {
    public:
        explicit BollingerConfirmation(double boost = 0.1);
        virtual ~BollingerConfirmation() override = default;

        std::optional<ScoreAdjustment> evaluate(const ScoringContext& context) const override;
        std::string describe() const override;

    private:
        double boost_;
    };

    // Rewards reversion against the EMA trend: BUY below the EMA, SELL above it.
    class EmaCounterTrendConfirmation : public IScoreAdjustment {
    public:
        explicit EmaCounterTrendConfirmation(double boost = 0.05);
        virtual ~EmaCounterTrendConfirmation() override = default;

        std::optional<ScoreAdjustment> evaluate(const ScoringContext& context) const override;
        std::string describe() const override;

    private:
        double boost_;
    };

    // RSI, Bollinger, EMA, in that order.
    std::vector<std::unique_ptr<IScoreAdjustment>> defaultScoreAdjustments();

} // namespace strategy_engine
