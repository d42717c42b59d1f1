#include "database_manager.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include <utility>

namespace data
{

    DatabaseManager::DatabaseManager(const std::string &db_path)
        : database_path_(db_path), db_(nullptr), connected_(false)
    {
        core::logging::getLogger()->debug("Bar store configured at {}", db_path);
    }

    DatabaseManager::~DatabaseManager()
    {
        disconnect();
    }

    DatabaseManager::DatabaseManager(DatabaseManager &&other) noexcept
        : database_path_(std::move(other.database_path_)),
          db_(std::exchange(other.db_, nullptr)),
          connected_(std::exchange(other.connected_, false)),
          last_query_failed_(other.last_query_failed_)
    {
    }

    DatabaseManager &DatabaseManager::operator=(DatabaseManager &&other) noexcept
    {
        if (this != &other)
        {
            disconnect();
            database_path_ = std::move(other.database_path_);
            db_ = std::exchange(other.db_, nullptr);
            connected_ = std::exchange(other.connected_, false);
            last_query_failed_ = other.last_query_failed_;
        }
        return *this;
    }

    bool DatabaseManager::connect()
    {
        if (connected_)
        {
            core::logging::getLogger()->debug("Bar store {} already open.", database_path_);
            return true;
        }

        core::logging::getLogger()->debug("Opening bar store {}", database_path_);

        int rc = sqlite3_open_v2(database_path_.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("Opening bar store {} failed: {}", database_path_, sqlite3_errmsg(db_));
            sqlite3_close(db_); // Handle must be closed even when open failed
            db_ = nullptr;
            return false;
        }

        connected_ = true;
        core::logging::getLogger()->info("Bar store {} open.", database_path_);
        return true;
    }

    void DatabaseManager::disconnect()
    {
        if (!connected_)
        {
            return;
        }
        core::logging::getLogger()->debug("Closing bar store {}", database_path_);
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK)
        {
            // Usually an unfinalized statement
            core::logging::getLogger()->error("Closing bar store {} failed: {}", database_path_, sqlite3_errmsg(db_));
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
            core::logging::getLogger()->error("Bar store {} is not open; statement skipped.", database_path_);
            return false;
        }

        core::logging::getLogger()->trace("exec: {}", sql);

        char *error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

        if (rc != SQLITE_OK)
        {
            core::logging::getLogger()->error("SQL error: {}", error_msg ? error_msg : sqlite3_errmsg(db_));
            sqlite3_free(error_msg);
            return false;
        }
        return true;
    }

    bool DatabaseManager::initializeSchema()
    {
        if (!isConnected())
        {
            core::logging::getLogger()->error("Bar store {} is not open; schema not created.", database_path_);
            return false;
        }

        const std::string create_daily_sql = R"(
        CREATE TABLE IF NOT EXISTS stocks_daily (
            code TEXT NOT NULL,
            timestamp TEXT NOT NULL, -- UTC ISO-8601
            open REAL NOT NULL,
            high REAL NOT NULL,
            low REAL NOT NULL,
            close REAL NOT NULL,
            volume REAL, -- NULL when the source has no volume
            PRIMARY KEY (code, timestamp)
        );
    )";

        bool success = executeSQL(create_daily_sql);
        if (success)
        {
            core::logging::getLogger()->debug("Bar store schema ready.");
        }
        else
        {
            core::logging::getLogger()->error("Creating the bar store schema in {} failed.", database_path_);
        }
        return success;
    }

    core::BarSeries DatabaseManager::queryBars(const std::string &code,
                                               std::optional<core::Timestamp> from,
                                               std::optional<core::Timestamp> to)
    {
        core::BarSeries bars;
        last_query_failed_ = false;
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot query bars: Not connected to database.");
            last_query_failed_ = true;
            return bars;
        }

        // Open bounds collapse to strings that sort before/after any ISO timestamp
        std::string from_str = from ? core::utils::timestampToString(*from) : std::string("0000");
        std::string to_str = to ? core::utils::timestampToString(*to) : std::string("9999");

        logger->debug("Querying bars for {} between '{}' and '{}'", code, from_str, to_str);

        const char *sql = R"(
            SELECT timestamp, open, high, low, close, volume
            FROM stocks_daily
            WHERE code = ?
              AND timestamp >= ?
              AND timestamp <= ?
            ORDER BY timestamp ASC;
        )";

        sqlite3_stmt *stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK)
        {
            logger->error("Failed to prepare bar query [{}]: {}", rc, sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            last_query_failed_ = true;
            return bars;
        }

        sqlite3_bind_text(stmt, 1, code.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, from_str.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 3, to_str.c_str(), -1, SQLITE_TRANSIENT);

        int row_count = 0;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
        {
            row_count++;
            const unsigned char *ts_text = sqlite3_column_text(stmt, 0);
            if (!ts_text)
            {
                logger->warn("NULL timestamp found for {} (row {}), skipping row.", code, row_count);
                continue;
            }

            core::Bar bar;
            try
            {
                bar.timestamp = core::utils::stringToTimestamp(reinterpret_cast<const char *>(ts_text));
            }
            catch (const std::runtime_error &e)
            {
                logger->warn("Unparseable timestamp for {} (row {}): {}", code, row_count, e.what());
                continue;
            }
            bar.open = sqlite3_column_double(stmt, 1);
            bar.high = sqlite3_column_double(stmt, 2);
            bar.low = sqlite3_column_double(stmt, 3);
            bar.close = sqlite3_column_double(stmt, 4);
            if (sqlite3_column_type(stmt, 5) != SQLITE_NULL)
            {
                bar.volume = sqlite3_column_double(stmt, 5);
            }
            bars.push_back(bar);
        }

        if (rc != SQLITE_DONE)
        {
            logger->error("Error stepping through bar query results [{}]: {}", rc, sqlite3_errmsg(db_));
            last_query_failed_ = true;
        }
        else
        {
            logger->debug("Loaded {} bars for {}.", bars.size(), code);
        }

        sqlite3_finalize(stmt);
        return bars;
    }

    core::BarSeries DatabaseManager::loadBars(const std::string &code,
                                              std::optional<core::Timestamp> from,
                                              std::optional<core::Timestamp> to)
    {
        if (code.empty())
        {
            throw core::DataLoadException("Bar request needs a non-empty code.");
        }
        if (from && to && *from > *to)
        {
            throw core::DataLoadException("Bar request for " + code + " has from > to: " +
                                          core::utils::timestampToString(*from) + " > " +
                                          core::utils::timestampToString(*to));
        }
        if (!isConnected())
        {
            throw core::DataLoadException("Cannot load bars for " + code + ": database " + database_path_ + " not connected.");
        }

        core::BarSeries bars = queryBars(code, from, to);
        if (last_query_failed_)
        {
            throw core::DataLoadException("Bar query failed for " + code + ": " + sqlite3_errmsg(db_));
        }
        return bars;
    }

    bool DatabaseManager::saveBars(const std::string &code, const core::BarSeries &bars)
    {
        auto logger = core::logging::getLogger();
        if (!isConnected())
        {
            logger->error("Cannot save bars: Not connected to database.");
            return false;
        }
        if (bars.empty())
        {
            logger->debug("No bars provided to save for {}.", code);
            return true;
        }

        const char *sql = R"(
INSERT OR IGNORE INTO stocks_daily
(code, timestamp, open, high, low, close, volume)
VALUES (?, ?, ?, ?, ?, ?, ?);
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
            std::string timestamp_str = core::utils::timestampToString(bar.timestamp);
            sqlite3_bind_text(stmt, 1, code.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(stmt, 2, timestamp_str.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_double(stmt, 3, bar.open);
            sqlite3_bind_double(stmt, 4, bar.high);
            sqlite3_bind_double(stmt, 5, bar.low);
            sqlite3_bind_double(stmt, 6, bar.close);
            if (bar.volume)
            {
                sqlite3_bind_double(stmt, 7, *bar.volume);
            }
            else
            {
                sqlite3_bind_null(stmt, 7);
            }

            rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
            {
                logger->error("Failed to execute insert step [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
            if (sqlite3_changes(db_) > 0)
            {
                saved_count++;
            }

            rc = sqlite3_reset(stmt);
            if (rc != SQLITE_OK)
            {
                logger->error("Failed to reset prepared statement [{}]: {}", rc, sqlite3_errmsg(db_));
                success = false;
                break;
            }
        }

        // Finalize before COMMIT/ROLLBACK
        sqlite3_finalize(stmt);

        if (!executeSQL(success ? "COMMIT;" : "ROLLBACK;"))
        {
            logger->error("Failed to {} transaction for saving bars.", success ? "COMMIT" : "ROLLBACK");
            if (success && !executeSQL("ROLLBACK;"))
            {
                logger->error("ROLLBACK after failed COMMIT also failed for {}.", code);
            }
            return false;
        }

        if (success)
        {
            logger->info("Saved {} new bars (duplicates ignored) for {}.", saved_count, code);
        }
        else
        {
            logger->warn("Transaction rolled back due to error during bar save for {}.", code);
        }
        return success;
    }

} // namespace data
