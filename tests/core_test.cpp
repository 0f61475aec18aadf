#include <gtest/gtest.h>
#include "decimal.hpp"
#include "config.hpp"
#include "config_loader.hpp"
#include "datatypes.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "logging.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using core::Decimal;
namespace dec = core::decimal;

TEST(DecimalTest, ParsesAndPrintsExactly) {
    Decimal a = dec::fromString("0.1");
    Decimal b = dec::fromString("0.2");
    EXPECT_EQ(a + b, dec::fromString("0.3"));
    EXPECT_EQ(dec::toPlainString(dec::fromString("123.4500")), "123.45");
    EXPECT_EQ(dec::toString(dec::fromString("2.5"), 3), "2.500");
    EXPECT_EQ(dec::fromDouble(0.1), dec::fromString("0.1"));
}

TEST(DecimalTest, RejectsMalformedText) {
    EXPECT_THROW(dec::fromString(""), std::invalid_argument);
    EXPECT_THROW(dec::fromString("abc"), std::invalid_argument);
}

TEST(DecimalTest, RejectsNonFiniteText) {
    EXPECT_THROW(dec::fromString("inf"), std::invalid_argument);
    EXPECT_THROW(dec::fromString("-inf"), std::invalid_argument);
    EXPECT_THROW(dec::fromString("nan"), std::invalid_argument);
}

TEST(DecimalTest, QuantizeDownTruncatesTowardZero) {
    EXPECT_EQ(dec::quantizeDown(dec::fromString("1.123456789"), 8), dec::fromString("1.12345678"));
    EXPECT_EQ(dec::quantizeDown(dec::fromString("-1.999"), 2), dec::fromString("-1.99"));
    EXPECT_EQ(dec::quantizeDown(Decimal(5), 0), Decimal(5));
}

TEST(DatatypesTest, MarkPositionComputesPnl) {
    core::Position position;
    position.entry_price = Decimal(100);
    position.size = Decimal(2);
    position.status = core::PositionStatus::Open;

    core::markPosition(position, Decimal(90));
    ASSERT_TRUE(position.pnl.has_value());
    EXPECT_EQ(*position.pnl, Decimal(-20));
    EXPECT_EQ(*position.pnl_percent, Decimal(-10));

    position.status = core::PositionStatus::Closed;
    core::markPosition(position, Decimal(120));
    EXPECT_EQ(*position.pnl, Decimal(-20)); // Closed positions keep their exit pnl
}

TEST(UtilsTest, TimestampRoundTrip) {
    core::Timestamp ts = core::utils::stringToTimestamp("2024-03-01T14:00:00Z");
    EXPECT_EQ(core::utils::timestampToString(ts), "2024-03-01T14:00:00Z");
    EXPECT_EQ(core::utils::stringToTimestamp("2024-03-01T19:30:00+05:30"), ts);
    EXPECT_EQ(core::utils::fromUnixMillis(core::utils::toUnixMillis(ts)), ts);
}

TEST(UtilsTest, LocalDayStartIsNotAfterTimestamp) {
    core::Timestamp ts = core::utils::stringToTimestamp("2024-03-01T14:00:00Z");
    core::Timestamp start = core::utils::localDayStart(ts);
    EXPECT_LE(start, ts);
    EXPECT_LT(ts - start, std::chrono::hours(25));
}

TEST(ConfigTest, DefaultsAreValid) {
    core::EngineConfig config;
    EXPECT_NO_THROW(core::validateConfig(config));
    EXPECT_EQ(config.strategy.ma_period, 20);
    EXPECT_EQ(config.risk.max_open_positions, 3);
}

TEST(ConfigTest, ValidationCollectsErrors) {
    core::EngineConfig config;
    config.strategy.ma_period = 1;
    config.risk.risk_per_trade = Decimal("0.5");
    try {
        core::validateConfig(config);
        FAIL() << "Expected ConfigException";
    } catch (const core::ConfigException& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("ma_period"), std::string::npos);
        EXPECT_NE(message.find("risk_per_trade"), std::string::npos);
    }
}

TEST(ConfigLoaderTest, ReadsSectionsAndDecimalStrings) {
    core::json doc = core::json::parse(R"({
        "strategy": { "ma_period": 30, "std_dev_multiplier": "2.5" },
        "risk": { "max_position_size": 500, "risk_per_trade": "0.01" },
        "backtest": { "initial_balance": "2500.50", "fee_rate": 0.001,
                      "start_date": "2024-01-01T00:00:00Z" },
        "trading": { "trading_enabled": true }
    })");
    core::EngineConfig config = core::ConfigLoader::fromJson(doc);

    EXPECT_EQ(config.strategy.ma_period, 30);
    EXPECT_EQ(config.strategy.std_dev_multiplier, dec::fromString("2.5"));
    EXPECT_EQ(config.risk.max_position_size, Decimal(500));
    EXPECT_EQ(config.risk.risk_per_trade, dec::fromString("0.01"));
    EXPECT_EQ(config.risk.max_daily_loss, Decimal(50)); // 10% of max_position_size
    EXPECT_EQ(config.backtest.initial_balance, dec::fromString("2500.50"));
    EXPECT_EQ(config.backtest.fee_rate, dec::fromString("0.001"));
    ASSERT_TRUE(config.backtest.start_time.has_value());
    EXPECT_EQ(*config.backtest.start_time, core::utils::stringToTimestamp("2024-01-01T00:00:00Z"));
    EXPECT_TRUE(config.trading.trading_enabled);
}

TEST(ConfigLoaderTest, WrongTypeIsConfigError) {
    core::json doc = core::json::parse(R"({ "strategy": { "ma_period": "twenty" } })");
    EXPECT_THROW(core::ConfigLoader::fromJson(doc), core::ConfigException);
}

TEST(ConfigLoaderTest, EnvironmentOverridesApply) {
    setenv("MA_PERIOD", "15", 1);
    setenv("STD_DEV_MULTIPLIER", "1.5", 1);
    setenv("PAPER_TRADING", "false", 1);
    core::EngineConfig config;
    core::ConfigLoader::applyEnvironmentOverrides(config);
    unsetenv("MA_PERIOD");
    unsetenv("STD_DEV_MULTIPLIER");
    unsetenv("PAPER_TRADING");

    EXPECT_EQ(config.strategy.ma_period, 15);
    EXPECT_EQ(config.strategy.std_dev_multiplier, dec::fromString("1.5"));
    EXPECT_FALSE(config.trading.paper_trading);
}

TEST(ConfigLoaderTest, DailyLossCapFollowsPositionSizeOverride) {
    setenv("MAX_POSITION_SIZE", "5000", 1);
    core::EngineConfig defaults;
    core::ConfigLoader::applyEnvironmentOverrides(defaults);

    core::EngineConfig loaded = core::ConfigLoader::fromJson(core::json::parse(R"({ "risk": { "max_position_size": 200 } })"));
    EXPECT_EQ(loaded.risk.max_daily_loss, Decimal(20));
    core::ConfigLoader::applyEnvironmentOverrides(loaded);
    unsetenv("MAX_POSITION_SIZE");

    EXPECT_EQ(defaults.risk.max_position_size, Decimal(5000));
    EXPECT_EQ(defaults.risk.max_daily_loss, Decimal(500));
    EXPECT_EQ(loaded.risk.max_daily_loss, Decimal(500));
}

TEST(ConfigLoaderTest, ExplicitDailyLossCapSurvivesPositionSizeOverride) {
    core::EngineConfig config = core::ConfigLoader::fromJson(
        core::json::parse(R"({ "risk": { "max_position_size": 200, "max_daily_loss": "75" } })"));
    EXPECT_FALSE(config.risk.daily_loss_follows_position_size);

    setenv("MAX_POSITION_SIZE", "5000", 1);
    core::ConfigLoader::applyEnvironmentOverrides(config);
    unsetenv("MAX_POSITION_SIZE");

    EXPECT_EQ(config.risk.max_position_size, Decimal(5000));
    EXPECT_EQ(config.risk.max_daily_loss, Decimal(75));

    core::EngineConfig reloaded = core::ConfigLoader::fromJson(core::ConfigLoader::toJson(config));
    EXPECT_FALSE(reloaded.risk.daily_loss_follows_position_size);
    EXPECT_EQ(reloaded.risk.max_daily_loss, Decimal(75));
}

TEST(ConfigLoaderTest, BadEnvironmentValueIsConfigError) {
    setenv("RISK_PER_TRADE", "lots", 1);
    core::EngineConfig config;
    EXPECT_THROW(core::ConfigLoader::applyEnvironmentOverrides(config), core::ConfigException);
    unsetenv("RISK_PER_TRADE");
}

TEST(ConfigLoaderTest, ToJsonRoundTrips) {
    core::EngineConfig config;
    config.strategy.ma_period = 25;
    config.backtest.fee_rate = dec::fromString("0.004");
    core::EngineConfig reloaded = core::ConfigLoader::fromJson(core::ConfigLoader::toJson(config));
    EXPECT_EQ(reloaded.strategy.ma_period, 25);
    EXPECT_EQ(reloaded.backtest.fee_rate, dec::fromString("0.004"));
}

// --- logging ---

class LoggingTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("reversion_logging_" + std::to_string(
                    std::chrono::steady_clock::now().time_since_epoch().count()));
    }

    void TearDown() override {
        unsetenv("SPDLOG_LEVEL");
        core::logging::initialize(test_helpers::testLogSettings());
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    core::logging::LogSettings settingsInTempDir() {
        core::logging::LogSettings settings = test_helpers::testLogSettings();
        settings.base_filename = "channels";
        settings.directory = dir_.string();
        return settings;
    }
};

TEST_F(LoggingTest, WritesIntoTheConfiguredDirectory) {
    std::string path = core::logging::initialize(settingsInTempDir());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::path(path).parent_path(), dir_);
    EXPECT_EQ(std::filesystem::path(path).filename().string().rfind("channels_", 0), 0u);
}

TEST_F(LoggingTest, ChannelsAreNamedAndShareSinks) {
    core::logging::initialize(settingsInTempDir());
    auto& engine = core::logging::getLogger();
    auto& trade = core::logging::getChannel(core::logging::Channel::Trade);

    EXPECT_EQ(engine->name(), "engine");
    EXPECT_EQ(trade->name(), "trade");
    EXPECT_EQ(core::logging::getChannel(core::logging::Channel::Signal)->name(), "signal");
    EXPECT_EQ(core::logging::getChannel(core::logging::Channel::Metric)->name(), "metric");
    ASSERT_EQ(trade->sinks().size(), 2u);
    EXPECT_EQ(trade->sinks()[0], engine->sinks()[0]);
    EXPECT_EQ(trade->sinks()[1], engine->sinks()[1]);
}

TEST_F(LoggingTest, ChannelLevelsComeFromSettings) {
    core::logging::LogSettings settings = settingsInTempDir();
    settings.channel_levels[core::logging::Channel::Metric] = spdlog::level::off;
    core::logging::initialize(settings);

    EXPECT_EQ(core::logging::getLogger()->level(), spdlog::level::debug);
    EXPECT_EQ(core::logging::getChannel(core::logging::Channel::Signal)->level(), spdlog::level::info);
    EXPECT_EQ(core::logging::getChannel(core::logging::Channel::Metric)->level(), spdlog::level::off);
}

TEST_F(LoggingTest, EnvironmentOverridesOneChannel) {
    setenv("SPDLOG_LEVEL", "trade=trace", 1);
    core::logging::initialize(settingsInTempDir());

    EXPECT_EQ(core::logging::getChannel(core::logging::Channel::Trade)->level(), spdlog::level::trace);
    EXPECT_EQ(core::logging::getChannel(core::logging::Channel::Signal)->level(), spdlog::level::info);
}

TEST_F(LoggingTest, UncreatableDirectoryIsReported) {
    std::filesystem::create_directories(dir_);
    std::filesystem::path blocker = dir_ / "not_a_dir";
    { std::ofstream(blocker.string()) << "x"; }

    core::logging::LogSettings settings = settingsInTempDir();
    settings.directory = (blocker / "logs").string();
    EXPECT_THROW(core::logging::initialize(settings), core::TradingPlatformException);
}
