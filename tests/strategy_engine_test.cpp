#include <gtest/gtest.h>
#include "signal_engine.hpp"
#include "signal_deduplicator.hpp"
#include "score_adjustments.hpp"
#include "config.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <memory>
#include <vector>

using core::Decimal;
namespace dec = core::decimal;

namespace {

    core::Indicators indicatorsAround(const Decimal& sma, const Decimal& std_dev) {
        core::Indicators indicators;
        indicators.sma = sma;
        indicators.std_dev = std_dev;
        indicators.upper_band = sma + std_dev * 2;
        indicators.lower_band = sma - std_dev * 2;
        return indicators;
    }

} // namespace

class SignalEngineTest : public ::testing::Test {
protected:
    core::EngineConfig config_;
    std::unique_ptr<strategy_engine::SignalEngine> plain_; // No score adjustments

    void SetUp() override {
        plain_ = std::make_unique<strategy_engine::SignalEngine>(
            config_, std::vector<std::unique_ptr<strategy_engine::IScoreAdjustment>>{});
    }

    std::optional<core::TradingSignal> plainSignal(const Decimal& price, const core::Indicators& indicators) {
        return plain_->generateSignal(price, Decimal(1000000), test_helpers::baseTime(), indicators);
    }
};

TEST_F(SignalEngineTest, SingleDropGivesStrongBuy) {
    strategy_engine::SignalEngine engine(config_);
    auto bars = test_helpers::flatThenDrop(25, Decimal(100), Decimal(80));

    auto signal = engine.analyze(bars);
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->type, core::SignalType::Buy);
    EXPECT_DOUBLE_EQ(signal->strength, 1.0);
    EXPECT_EQ(signal->price, Decimal(80));
    EXPECT_EQ(signal->timestamp, bars.back().timestamp);
    EXPECT_EQ(signal->reason.rfind("Price 4.36 std devs below mean - strong oversold", 0), 0u) << signal->reason;
    EXPECT_NE(signal->reason.find("price below lower Bollinger Band"), std::string::npos);
    ASSERT_TRUE(signal->indicators.z_score.has_value());
    EXPECT_LT(*signal->indicators.z_score, Decimal(-4));
}

TEST_F(SignalEngineTest, SingleSpikeGivesStrongSell) {
    strategy_engine::SignalEngine engine(config_);
    auto signal = engine.analyze(test_helpers::flatThenDrop(25, Decimal(100), Decimal(120)));
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->type, core::SignalType::Sell);
    EXPECT_NE(signal->reason.find("strong overbought"), std::string::npos);
}

TEST_F(SignalEngineTest, FlatSeriesGivesNoSignal) {
    strategy_engine::SignalEngine engine(config_);
    EXPECT_FALSE(engine.analyze(test_helpers::makeSeries(std::vector<Decimal>(30, Decimal(100)))).has_value());
}

TEST_F(SignalEngineTest, ShortWindowGivesNoSignal) {
    strategy_engine::SignalEngine engine(config_);
    EXPECT_FALSE(engine.analyze(test_helpers::flatThenDrop(10, Decimal(100), Decimal(80))).has_value());
}

TEST_F(SignalEngineTest, LowVolumeGivesNoSignal) {
    auto signal = plain_->generateSignal(Decimal(80), Decimal(9999), test_helpers::baseTime(),
                                         indicatorsAround(Decimal(100), Decimal(5)));
    EXPECT_FALSE(signal.has_value());
}

TEST_F(SignalEngineTest, StrongThresholdIsInclusive) {
    // z == -2 exactly
    auto signal = plainSignal(Decimal(80), indicatorsAround(Decimal(100), Decimal(10)));
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(signal->type, core::SignalType::Buy);
    EXPECT_NEAR(signal->strength, 2.0 / 3.0, 1e-12);
    EXPECT_EQ(signal->reason, "Price 2.00 std devs below mean - strong oversold");
}

TEST_F(SignalEngineTest, ModerateSignalIsCappedBelowStrong) {
    auto buy = plainSignal(Decimal(90), indicatorsAround(Decimal(100), Decimal(10)));
    ASSERT_TRUE(buy.has_value());
    EXPECT_EQ(buy->type, core::SignalType::Buy);
    EXPECT_DOUBLE_EQ(buy->strength, 0.5);
    EXPECT_EQ(buy->reason, "Price 1.00 std devs below mean - moderate oversold");

    auto sell = plainSignal(Decimal("119.9"), indicatorsAround(Decimal(100), Decimal(10)));
    ASSERT_TRUE(sell.has_value());
    EXPECT_EQ(sell->type, core::SignalType::Sell);
    EXPECT_NEAR(sell->strength, 0.7, 1e-12);
}

TEST_F(SignalEngineTest, WeakAndNeutralSignalsAreDropped) {
    // z = -0.55: moderate BUY with strength 0.275, under the floor
    EXPECT_FALSE(plainSignal(Decimal("94.5"), indicatorsAround(Decimal(100), Decimal(10))).has_value());
    // z = 0.05: neutral zone, strength 0.1
    EXPECT_FALSE(plainSignal(Decimal("100.5"), indicatorsAround(Decimal(100), Decimal(10))).has_value());
    // z = 0.3: between exit and entry thresholds
    EXPECT_FALSE(plainSignal(Decimal(103), indicatorsAround(Decimal(100), Decimal(10))).has_value());
}

TEST_F(SignalEngineTest, ZeroDeviationGivesNoSignal) {
    EXPECT_FALSE(plainSignal(Decimal(100), indicatorsAround(Decimal(100), Decimal(0))).has_value());
}

TEST_F(SignalEngineTest, ConfirmationsBoostStrengthAndExtendReason) {
    strategy_engine::SignalEngine engine(config_);
    core::Indicators indicators = indicatorsAround(Decimal(100), Decimal(10));
    indicators.lower_band = Decimal(95);
    indicators.rsi = 25.0;
    indicators.ema = 95.0;

    auto signal = engine.generateSignal(Decimal(90), Decimal(1000000), test_helpers::baseTime(), indicators);
    ASSERT_TRUE(signal.has_value());
    EXPECT_NEAR(signal->strength, 0.85, 1e-12);
    EXPECT_EQ(signal->reason,
              "Price 1.00 std devs below mean - moderate oversold, RSI oversold, "
              "price below lower Bollinger Band, counter-trend below EMA");
}

TEST_F(SignalEngineTest, BoostsNeverExceedOne) {
    strategy_engine::SignalEngine engine(config_);
    core::Indicators indicators = indicatorsAround(Decimal(100), Decimal(10));
    indicators.rsi = 10.0;
    indicators.ema = 120.0;
    auto signal = engine.generateSignal(Decimal(60), Decimal(1000000), test_helpers::baseTime(), indicators);
    ASSERT_TRUE(signal.has_value());
    EXPECT_DOUBLE_EQ(signal->strength, 1.0);
}

TEST_F(SignalEngineTest, PositionSizeTakesTheSmallestLimit) {
    core::TradingSignal signal;
    signal.type = core::SignalType::Buy;
    signal.strength = 1.0;
    signal.price = Decimal(80);

    // strength 1000, risk 10000*0.02/(80*0.05) = 50, affordable 10000/80*0.95 = 118.75
    EXPECT_EQ(plain_->calculatePositionSize(signal, Decimal(10000), Decimal(80)), Decimal(50));

    // risk 100*0.02/4 = 0.5, affordable 1.1875
    EXPECT_EQ(plain_->calculatePositionSize(signal, Decimal(100), Decimal(80)), dec::fromString("0.5"));

    signal.strength = 0.01; // strength-based 10
    EXPECT_EQ(plain_->calculatePositionSize(signal, Decimal(10000), Decimal(80)), Decimal(10));

    EXPECT_EQ(plain_->calculatePositionSize(signal, Decimal(0), Decimal(80)), Decimal(0));
}

TEST_F(SignalEngineTest, PositionSizeIsQuantizedDown) {
    core::TradingSignal signal;
    signal.type = core::SignalType::Buy;
    signal.strength = 1.0;
    signal.price = Decimal(3);
    // risk 10*0.02/(3*0.05) = 1.3333...
    EXPECT_EQ(plain_->calculatePositionSize(signal, Decimal(10), Decimal(3)), dec::fromString("1.33333333"));
}

TEST_F(SignalEngineTest, RiskLevelsFollowSide) {
    auto buy = plain_->calculateRiskLevels(Decimal(100), core::SignalType::Buy);
    EXPECT_EQ(buy.stop_loss, Decimal(95));
    EXPECT_EQ(buy.take_profit, Decimal(110));

    auto sell = plain_->calculateRiskLevels(Decimal(100), core::SignalType::Sell);
    EXPECT_EQ(sell.stop_loss, Decimal(105));
    EXPECT_EQ(sell.take_profit, Decimal(90));
}

TEST(ScoreAdjustmentTest, RsiNeedsAValue) {
    strategy_engine::RsiConfirmation rsi;
    core::Indicators indicators;
    strategy_engine::ScoringContext context{core::SignalType::Buy, Decimal(90), &indicators};
    EXPECT_FALSE(rsi.evaluate(context).has_value());

    indicators.rsi = 75.0;
    EXPECT_FALSE(rsi.evaluate(context).has_value());
    context.type = core::SignalType::Sell;
    auto adjustment = rsi.evaluate(context);
    ASSERT_TRUE(adjustment.has_value());
    EXPECT_DOUBLE_EQ(adjustment->boost, 0.2);
    EXPECT_EQ(adjustment->reason_fragment, "RSI overbought");
}

TEST(ScoreAdjustmentTest, RsiRejectsInvertedLevels) {
    EXPECT_THROW(strategy_engine::RsiConfirmation(70.0, 30.0), std::invalid_argument);
}

TEST(SignalDeduplicatorTest, SameTypeInsideWindowIsIgnored) {
    strategy_engine::SignalDeduplicator dedup(std::chrono::minutes(5));
    core::TradingSignal signal;
    signal.type = core::SignalType::Buy;
    signal.timestamp = test_helpers::baseTime();

    EXPECT_TRUE(dedup.shouldAct(signal));
    signal.timestamp += std::chrono::minutes(4);
    EXPECT_FALSE(dedup.shouldAct(signal));

    signal.timestamp += std::chrono::minutes(2); // 6 minutes after the acted-on one
    EXPECT_TRUE(dedup.shouldAct(signal));
}

TEST(SignalDeduplicatorTest, OppositeTypeAlwaysActs) {
    strategy_engine::SignalDeduplicator dedup;
    core::TradingSignal signal;
    signal.type = core::SignalType::Buy;
    signal.timestamp = test_helpers::baseTime();
    EXPECT_TRUE(dedup.shouldAct(signal));

    signal.type = core::SignalType::Sell;
    EXPECT_TRUE(dedup.shouldAct(signal));
    ASSERT_TRUE(dedup.lastType().has_value());
    EXPECT_EQ(*dedup.lastType(), core::SignalType::Sell);
}

TEST(SignalDeduplicatorTest, HoldIsNeverActedOn) {
    strategy_engine::SignalDeduplicator dedup;
    core::TradingSignal signal;
    signal.type = core::SignalType::Hold;
    EXPECT_FALSE(dedup.shouldAct(signal));
    EXPECT_FALSE(dedup.lastType().has_value());

    signal.type = core::SignalType::Buy;
    EXPECT_TRUE(dedup.shouldAct(signal));
    dedup.reset();
    EXPECT_TRUE(dedup.shouldAct(signal));
}
