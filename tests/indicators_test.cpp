#include <gtest/gtest.h>
#include "indicator_calculator.hpp"
#include "talib_indicator.hpp"
#include "config.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using core::Decimal;
namespace dec = core::decimal;

namespace {

    core::StrategyParams paramsWithPeriod(int ma_period) {
        core::StrategyParams params;
        params.ma_period = ma_period;
        return params;
    }

} // namespace

TEST(IndicatorCalculatorTest, InsufficientDataYieldsNothing) {
    indicators::IndicatorCalculator calculator(paramsWithPeriod(20));
    auto bars = test_helpers::makeSeries(std::vector<Decimal>(19, Decimal(100)));
    EXPECT_FALSE(calculator.calculate(bars).has_value());
}

TEST(IndicatorCalculatorTest, FlatSeriesHasZeroDeviationAndNoZScore) {
    indicators::IndicatorCalculator calculator(paramsWithPeriod(20));
    auto result = calculator.calculate(test_helpers::makeSeries(std::vector<Decimal>(30, Decimal(100))));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sma, Decimal(100));
    EXPECT_EQ(result->std_dev, Decimal(0));
    EXPECT_EQ(result->upper_band, Decimal(100));
    EXPECT_EQ(result->lower_band, Decimal(100));
    EXPECT_FALSE(result->z_score.has_value());
}

TEST(IndicatorCalculatorTest, UsesOnlyTheLastMaPeriodCloses) {
    indicators::IndicatorCalculator calculator(paramsWithPeriod(4));
    std::vector<Decimal> closes = {Decimal(1000), Decimal(2), Decimal(4), Decimal(4), Decimal(6)};
    auto result = calculator.calculate(closes);
    ASSERT_TRUE(result.has_value());
    // mean of 2,4,4,6 = 4; population variance = (4+0+0+4)/4 = 2
    EXPECT_EQ(result->sma, Decimal(4));
    EXPECT_EQ(result->std_dev, dec::sqrt(Decimal(2)));
    EXPECT_EQ(result->upper_band, Decimal(4) + dec::sqrt(Decimal(2)) * 2);
    ASSERT_TRUE(result->z_score.has_value());
    EXPECT_EQ(*result->z_score, Decimal(2) / dec::sqrt(Decimal(2)));
}

TEST(IndicatorCalculatorTest, SingleDropProducesLargeNegativeZ) {
    indicators::IndicatorCalculator calculator(paramsWithPeriod(20));
    auto result = calculator.calculate(test_helpers::flatThenDrop(25, Decimal(100), Decimal(80)));
    ASSERT_TRUE(result.has_value());
    // 19 x 100 and one 80: mean 99, variance 19
    EXPECT_EQ(result->sma, Decimal(99));
    EXPECT_EQ(result->std_dev, dec::sqrt(Decimal(19)));
    ASSERT_TRUE(result->z_score.has_value());
    EXPECT_NEAR(dec::toDouble(*result->z_score), -4.3589, 1e-3);
}

TEST(IndicatorCalculatorTest, ConfirmationInputsNeedEnoughBars) {
    core::StrategyParams params = paramsWithPeriod(5);
    params.rsi_period = 14;
    params.ema_period = 10;
    indicators::IndicatorCalculator calculator(params);

    auto short_window = calculator.calculate(test_helpers::oscillatingSeries(8));
    ASSERT_TRUE(short_window.has_value());
    EXPECT_FALSE(short_window->rsi.has_value());
    EXPECT_FALSE(short_window->ema.has_value());

    auto long_window = calculator.calculate(test_helpers::oscillatingSeries(40));
    ASSERT_TRUE(long_window.has_value());
    ASSERT_TRUE(long_window->rsi.has_value());
    ASSERT_TRUE(long_window->ema.has_value());
    EXPECT_GE(*long_window->rsi, 0.0);
    EXPECT_LE(*long_window->rsi, 100.0);
}

TEST(IndicatorCalculatorTest, RejectsTinyPeriod) {
    EXPECT_THROW(indicators::IndicatorCalculator{paramsWithPeriod(1)}, std::invalid_argument);
}

TEST(PopulationStdDevTest, DividesByCount) {
    std::vector<Decimal> values = {Decimal(2), Decimal(4), Decimal(4), Decimal(4),
                                   Decimal(5), Decimal(5), Decimal(7), Decimal(9)};
    EXPECT_EQ(indicators::populationStdDev(values, Decimal(5)), Decimal(2));
    EXPECT_EQ(indicators::populationStdDev({}, Decimal(0)), Decimal(0));
}

TEST(TaLibIndicatorTest, RisingSeriesIsOverbought) {
    std::vector<Decimal> closes;
    for (int i = 0; i < 30; ++i) closes.push_back(Decimal(100 + i));
    indicators::TaLibIndicator rsi(indicators::TaLibFunction::Rsi, 14);
    rsi.calculate(test_helpers::makeSeries(closes));

    const auto& result = rsi.getResult();
    ASSERT_EQ(result.size(), closes.size() - static_cast<size_t>(rsi.getLookback()));
    EXPECT_NEAR(result.back(), 100.0, 1e-9);
    EXPECT_EQ(rsi.getName(), "RSI(14)");
}

TEST(TaLibIndicatorTest, ShortInputGivesNoResult) {
    auto rsi = indicators::makeRsi(14);
    rsi->calculate(test_helpers::oscillatingSeries(40));
    ASSERT_FALSE(rsi->getResult().empty());

    rsi->calculate(test_helpers::oscillatingSeries(10));
    EXPECT_TRUE(rsi->getResult().empty());
}

TEST(TaLibIndicatorTest, ConstantSeriesEmaConvergesToThePrice) {
    auto ema = indicators::makeEma(5);
    ema->calculate(test_helpers::makeSeries(std::vector<Decimal>(12, Decimal(50))));
    ASSERT_EQ(ema->getResult().size(), 8u);
    EXPECT_NEAR(ema->getResult().back(), 50.0, 1e-9);
    EXPECT_EQ(ema->getLookback(), 4);
    EXPECT_EQ(ema->getName(), "EMA(5)");
}

TEST(TaLibIndicatorTest, RejectsTinyPeriod) {
    EXPECT_THROW(indicators::makeRsi(1), std::invalid_argument);
    EXPECT_THROW(indicators::makeEma(0), std::invalid_argument);
}
