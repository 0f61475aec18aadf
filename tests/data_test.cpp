#include <gtest/gtest.h>
#include "csv_bar_loader.hpp"
#include "database_manager.hpp"
#include "sqlite_price_provider.hpp"
#include "price_provider.hpp"
#include "exceptions.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <vector>

using core::Decimal;
namespace dec = core::decimal;

// --- CsvBarLoader ---

TEST(CsvBarLoaderTest, ParsesIsoAndMillisRows) {
    std::istringstream input(
        "timestamp,open,high,low,close,volume\r\n"
        "2024-01-01T13:00:00Z,101.5,102,100.25,101.75,5000\r\n"
        "1704110400000,100,101,99,100.5,12000.125\n");
    auto bars = data::CsvBarLoader::load(input);

    ASSERT_EQ(bars.size(), 2u);
    // Sorted ascending
    EXPECT_EQ(bars[0].timestamp, test_helpers::baseTime());
    EXPECT_EQ(bars[0].close, dec::fromString("100.5"));
    EXPECT_EQ(bars[0].volume, dec::fromString("12000.125"));
    EXPECT_EQ(bars[1].timestamp, test_helpers::baseTime() + std::chrono::hours(1));
    EXPECT_EQ(bars[1].low, dec::fromString("100.25"));
    EXPECT_EQ(bars[1].source, "csv");
}

TEST(CsvBarLoaderTest, SkipsInvalidRows) {
    std::istringstream input(
        "2024-01-01T12:00:00Z,100,101,99,100,1000\n"
        "\n"
        "not-a-date,100,101,99,100,1000\n"
        "2024-01-01T13:00:00Z,100,101,99,-1,1000\n"
        "2024-01-01T14:00:00Z,100,98,99,100,1000\n"
        "2024-01-01T15:00:00Z,100,101,99,100,-5\n"
        "2024-01-01T16:00:00Z,100,101,99\n"
        "2024-01-01T17:00:00Z,100,101,99,100,0\n");
    auto bars = data::CsvBarLoader::load(input, "import");

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].source, "import");
    EXPECT_EQ(bars[1].volume, Decimal(0));
}

TEST(CsvBarLoaderTest, ParseLineRejectsMalformedInput) {
    EXPECT_THROW(data::CsvBarLoader::parseLine("1704110400000,1,2,x,1,1", "csv"), std::invalid_argument);
    EXPECT_THROW(data::CsvBarLoader::parseLine("1704110400000,1,2,1", "csv"), std::invalid_argument);
    EXPECT_NO_THROW(data::CsvBarLoader::parseLine(" 1704110400000 , 1 , 2 , 1 , 1 , 1 ", "csv"));
}

TEST(CsvBarLoaderTest, NonFinitePricesAreRejected) {
    EXPECT_THROW(data::CsvBarLoader::parseLine("1704110400000,100,inf,99,100,1000", "csv"), std::invalid_argument);
    EXPECT_THROW(data::CsvBarLoader::parseLine("1704110400000,100,101,99,inf,1000", "csv"), std::invalid_argument);
    EXPECT_THROW(data::CsvBarLoader::parseLine("1704110400000,100,101,99,100,nan", "csv"), std::invalid_argument);

    std::istringstream input(
        "2024-01-01T12:00:00Z,100,101,99,100,1000\n"
        "2024-01-01T13:00:00Z,inf,inf,inf,inf,1000\n");
    EXPECT_EQ(data::CsvBarLoader::load(input, "csv").size(), 1u);
}

TEST(CsvBarLoaderTest, MissingFileIsDataLoadError) {
    EXPECT_THROW(data::CsvBarLoader::load(std::string("/nonexistent/bars.csv")), core::DataLoadException);
}

// --- DatabaseManager / SqlitePriceProvider ---

class DatabaseTest : public ::testing::Test {
protected:
    data::DatabaseManager db_{":memory:"};

    void SetUp() override {
        ASSERT_TRUE(db_.connect());
        ASSERT_TRUE(db_.initializeSchema());
    }
};

TEST_F(DatabaseTest, SavesAndQueriesExactDecimals) {
    core::TimeSeries<core::PriceBar> bars;
    bars.push_back(test_helpers::makeBar(test_helpers::baseTime(), dec::fromString("142.123456789012345")));
    bars.push_back(test_helpers::makeBar(test_helpers::baseTime() + std::chrono::hours(1), dec::fromString("0.1")));
    ASSERT_TRUE(db_.saveBars(bars, "SOL-USD", "1h"));

    auto loaded = db_.queryBars("SOL-USD", "1h", test_helpers::baseTime(),
                                test_helpers::baseTime() + std::chrono::hours(1));
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].close, dec::fromString("142.123456789012345"));
    EXPECT_EQ(loaded[1].close, dec::fromString("0.1"));
    EXPECT_EQ(loaded[0].timestamp, test_helpers::baseTime());
    EXPECT_EQ(loaded[0].source, "test");
}

TEST_F(DatabaseTest, DuplicateBarsAreIgnored) {
    auto bars = test_helpers::makeSeries({Decimal(100), Decimal(101), Decimal(102)});
    ASSERT_TRUE(db_.saveBars(bars, "SOL-USD", "1h"));

    auto changed = bars;
    changed[0].close = Decimal(999);
    ASSERT_TRUE(db_.saveBars(changed, "SOL-USD", "1h"));

    auto loaded = db_.queryBars("SOL-USD", "1h", bars.front().timestamp, bars.back().timestamp);
    ASSERT_EQ(loaded.size(), 3u);
    EXPECT_EQ(loaded[0].close, Decimal(100));
}

TEST_F(DatabaseTest, QueryFiltersByKeyIntervalAndRange) {
    auto bars = test_helpers::makeSeries({Decimal(1), Decimal(2), Decimal(3), Decimal(4)});
    ASSERT_TRUE(db_.saveBars(bars, "SOL-USD", "1h"));
    ASSERT_TRUE(db_.saveBars(bars, "BTC-USD", "1h"));
    ASSERT_TRUE(db_.saveBars(bars, "SOL-USD", "1d"));

    auto loaded = db_.queryBars("SOL-USD", "1h", bars[1].timestamp, bars[2].timestamp);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].close, Decimal(2));
    EXPECT_EQ(loaded[1].close, Decimal(3));
}

TEST_F(DatabaseTest, SqliteProviderServesTheWindow) {
    auto bars = test_helpers::makeSeries({Decimal(10), Decimal(11), Decimal(12)});
    ASSERT_TRUE(db_.saveBars(bars, "SOL-USD", "1h"));

    data::SqlitePriceProvider provider(db_, "SOL-USD", "1h", bars.front().timestamp, bars.back().timestamp);
    EXPECT_EQ(provider.getPriceHistory().size(), 3u);
    EXPECT_EQ(provider.getCurrentPrice(), Decimal(12));

    data::SqlitePriceProvider empty(db_, "ETH-USD", "1h", bars.front().timestamp, bars.back().timestamp);
    EXPECT_TRUE(empty.getPriceHistory().empty());
    EXPECT_THROW(empty.getCurrentPrice(), core::DataLoadException);
}

TEST_F(DatabaseTest, SqliteProviderRejectsInvertedRange) {
    EXPECT_THROW(data::SqlitePriceProvider(db_, "SOL-USD", "1h", test_helpers::baseTime(),
                                           test_helpers::baseTime() - std::chrono::hours(1)),
                 core::DataLoadException);
}

TEST(DatabaseManagerTest, DisconnectedProviderIsDataLoadError) {
    data::DatabaseManager db(":memory:");
    EXPECT_FALSE(db.isConnected());
    data::SqlitePriceProvider provider(db, "SOL-USD", "1h", test_helpers::baseTime(), test_helpers::baseTime());
    EXPECT_THROW(provider.getPriceHistory(), core::DataLoadException);
    EXPECT_FALSE(db.saveBars(test_helpers::makeSeries({Decimal(1)}), "SOL-USD", "1h"));
}

// --- VectorPriceProvider ---

TEST(VectorPriceProviderTest, SortsAndAppends) {
    auto bars = test_helpers::makeSeries({Decimal(1), Decimal(2), Decimal(3)});
    std::swap(bars[0], bars[2]);
    data::VectorPriceProvider provider(bars);
    EXPECT_EQ(provider.getCurrentPrice(), Decimal(3));

    provider.append(test_helpers::makeBar(test_helpers::baseTime() + std::chrono::hours(5), Decimal(7)));
    EXPECT_EQ(provider.getCurrentPrice(), Decimal(7));
    EXPECT_EQ(provider.getPriceHistory().size(), 4u);

    data::VectorPriceProvider empty(core::TimeSeries<core::PriceBar>{});
    EXPECT_THROW(empty.getCurrentPrice(), core::DataLoadException);
}
