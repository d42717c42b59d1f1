#pragma once

#include <string>
#include <optional>

#include <sqlite3.h>

#include "datatypes.hpp"
#include "bar_data_provider.hpp"

namespace data {

// Local SQLite bar store. Daily bars live in `stocks_daily`, keyed by
// (code, timestamp); timestamps are stored as UTC ISO-8601 text so that
// text comparison orders them chronologically.
class DatabaseManager : public IBarDataProvider {
public:
    explicit DatabaseManager(const std::string& db_path);
    ~DatabaseManager() override;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;
    DatabaseManager(DatabaseManager&& other) noexcept;
    DatabaseManager& operator=(DatabaseManager&& other) noexcept;

    bool connect();
    void disconnect();
    bool isConnected() const;

    bool initializeSchema();
    bool executeSQL(const std::string& sql);

    // INSERT OR IGNORE inside one transaction; rolled back on the first failure.
    bool saveBars(const std::string& code, const core::BarSeries& bars);

    core::BarSeries queryBars(const std::string& code,
                              std::optional<core::Timestamp> from,
                              std::optional<core::Timestamp> to);

    // IBarDataProvider. Throws core::DataLoadException when not connected or
    // when the query itself fails.
    core::BarSeries loadBars(const std::string& code,
                             std::optional<core::Timestamp> from,
                             std::optional<core::Timestamp> to) override;

private:
    std::string database_path_;
    sqlite3* db_ = nullptr;
    bool connected_ = false;
    bool last_query_failed_ = false;
};

} // namespace data
