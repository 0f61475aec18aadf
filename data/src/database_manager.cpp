#include "database_manager.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cstdint>
#include <stdexcept>

namespace data
{

    namespace
    {
        std::string columnText(sqlite3_stmt *stmt, int column)
        {
            const unsigned char *text = sqlite3_column_text(stmt, column);
            if (!text)
            {
                throw std::invalid_argument("NULL value in column " + std::to_string(column));
            }
            return reinterpret_cast<const char *>(text);
        }
    } // end anonymous namespace

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("DatabaseManager (SQLite) created for path: {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->warn("Already connected to SQLite database {}.", database_path_);
            return true;
        }

        core::logging::getLogger()->info("Connecting to SQLite database: {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Cannot open SQLite database '{}': {}", database_path_,
                                              db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
            sqlite3_close(db_); // Handle must be closed even when open failed
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Successfully connected to SQLite database: {}", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->info("Disconnecting from SQLite database: {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually an unfinalized statement
            core::logging::getLogger()->error("Error disconnecting from SQLite database: {}", sqlite3_errmsg(db_));
        }
        db_ = nullptr;
        connected_ = false;
    }

    bool DatabaseManager::isConnected() const
    {
        return connected_ && (db_ != nullptr);
    }

    bool DatabaseManager::executeSQL(const std::string &sql)
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot execute SQL: Not connected to database.");
            return false;
        }

        core::logging::getLogger()->trace("Executing SQL (SQLite): {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errstr(rc));
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Cannot initialize schema: Not connected to database.");
            return false;
        }
        core::logging::getLogger()->info("Initializing SQLite database schema if needed...");

        // Prices and volumes are TEXT so decimal values round-trip exactly.
        // Timestamps are unix milliseconds for ordering and range queries.
        const std::string create_bars_sql = R"(
        CREATE TABLE IF NOT EXISTS price_bars (
            instrument_key TEXT NOT NULL,
            interval TEXT NOT NULL,
            timestamp_ms INTEGER NOT NULL,
            open TEXT NOT NULL,
            high TEXT NOT NULL,
            low TEXT NOT NULL,
            close TEXT NOT NULL,
            volume TEXT NOT NULL,
            source TEXT,
            PRIMARY KEY (instrument_key, interval, timestamp_ms)
        );
    )";

        const std::string create_bars_index_sql = R"(
        CREATE INDEX IF NOT EXISTS idx_price_bars_timestamp
        ON price_bars (instrument_key, interval, timestamp_ms);
    )";

        bool success = executeSQL(create_bars_sql);
        success = success && executeSQL(create_bars_index_sql);

        if (success)
        {
            core::logging::getLogger()->info("SQLite database schema initialization check complete.");
        }
        else
        {
            core::logging::getLogger()->error("SQLite database schema initialization failed.");
        }
        return success;
    }

    core::TimeSeries<core::PriceBar> DatabaseManager::queryBars(
        const std::string &instrument_key,
        const std::string &interval,
        core::Timestamp start_time,
        core::Timestamp end_time)
    {
        core::TimeSeries<core::PriceBar> bars;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query bars: Not connected to database.");
            return bars;
        }

        logger->debug("Querying bars for {} ({}) between {} and {}", instrument_key, interval,
                      core::utils::timestampToString(start_time), core::utils::timestampToString(end_time));

        const char *sql = R"(
            SELECT timestamp_ms, open, high, low, close, volume, source
            FROM price_bars
            WHERE instrument_key = ?
              AND interval = ?
              AND timestamp_ms >= ?
              AND timestamp_ms <= ?
            ORDER BY timestamp_ms ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare bar query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return bars;
        }

        sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 3, core::utils::toUnixMillis(start_time));
        sqlite3_bind_int64(stmt, 4, core::utils::toUnixMillis(end_time));

        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            ++row_count;
            try
            {
                core::PriceBar bar;
                bar.timestamp = core::utils::fromUnixMillis(sqlite3_column_int64(stmt, 0));
                bar.open = core::decimal::fromString(columnText(stmt, 1));
                bar.high = core::decimal::fromString(columnText(stmt, 2));
                bar.low = core::decimal::fromString(columnText(stmt, 3));
                bar.close = core::decimal::fromString(columnText(stmt, 4));
                bar.volume = core::decimal::fromString(columnText(stmt, 5));
                const unsigned char *source = sqlite3_column_text(stmt, 6);
                bar.source = source ? reinterpret_cast<const char *>(source) : "sqlite";
                bars.push_back(std::move(bar));
            }
            catch (const std::invalid_argument &e)
            {
                logger->warn("Skipping malformed price_bars row {}: {}", row_count, e.what());
            }
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through query results [{}]: {}", rc, sqlite3_errmsg(db_));
        }
        else
        {
            logger->debug("Loaded {} bars from {} rows.", bars.size(), row_count);
        }

        sqlite3_finalize(stmt);
        return bars;
    }

    bool DatabaseManager::saveBars(const core::TimeSeries<core::PriceBar> &bars,
                                   const std::string &instrument_key,
                                   const std::string &interval)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            logger->debug("No bars provided to save for {} ({}).", instrument_key, interval);
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO price_bars
(instrument_key, interval, timestamp_ms, open, high, low, close, volume, source)
VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
)";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare INSERT statement [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return false;
        }

        if (!executeSQL("BEGIN TRANSACTION;"))
        {
            logger->error("Failed to begin transaction for saving bars.");
            sqlite3_finalize(stmt);
            return false;
        }

        bool success = true;
        int saved_count = 0;
        for (const auto &bar : bars)
        {
            const std::string open = core::decimal::toPlainString(bar.open);
            const std::string high = core::decimal::toPlainString(bar.high);
            const std::string low = core::decimal::toPlainString(bar.low);
            const std::string close = core::decimal::toPlainString(bar.close);
            const std::string volume = core::decimal::toPlainString(bar.volume);

            sqlite3_bind_text(stmt, 1, instrument_key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, interval.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 3, core::utils::toUnixMillis(bar.timestamp));
            sqlite3_bind_text(stmt, 4, open.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 5, high.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 6, low.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 7, close.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 8, volume.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 9, bar.source.c_str(), -1, SQLITE_TRANSIENT);

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                ++saved_count;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            sqlite3_clear_bindings(stmt);
        }

        // Finalize before COMMIT/ROLLBACK
        sqlite3_finalize(stmt);

        if (success)
        {
            if (!executeSQL("COMMIT;"))
            {
                logger->error("Failed to COMMIT transaction for saving bars.");
                if (!executeSQL("ROLLBACK;"))
                {
                    logger->error("Failed to ROLLBACK after failed COMMIT.");
                }
                return false;
            }
            logger->info("Saved {} new bars (duplicates ignored) for {} ({}).", saved_count, instrument_key, interval);
            return true;
        }

        if (!executeSQL("ROLLBACK;"))
        {
            logger->error("Failed to ROLLBACK transaction for saving bars.");
        }
        logger->warn("Transaction rolled back due to error during bar save for {} ({}).", instrument_key, interval);
        return false;
    }

} // namespace data
