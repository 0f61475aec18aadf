#pragma once

#include <string>
#include <vector>

#include <sqlite3.h>

#include "datatypes.hpp"

namespace data {

class DatabaseManager {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    bool connect();
    void disconnect();
    bool isConnected() const;

    // Creates price_bars and its index if missing
    bool initializeSchema();

    bool executeSQL(const std::string& sql);

    // Duplicates (same instrument, interval and timestamp) are ignored.
    // All rows go in one transaction, rolled back on the first failure.
    bool saveBars(const core::TimeSeries<core::PriceBar>& bars,
                  const std::string& instrument_key,
                  const std::string& interval);

    // Inclusive range, ascending. Rows with unparseable values are skipped with a warning.
    core::TimeSeries<core::PriceBar> queryBars(
        const std::string& instrument_key,
        const std::string& interval,
        core::Timestamp start_time,
        core::Timestamp end_time);

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
};

} // namespace data
