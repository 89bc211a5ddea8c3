/**
 * @file SQLiteDriver.cpp
 * @brief Implementation of the SQLite driver.
 */

#include "SQLiteDriver.hpp"
#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <climits>

namespace sqlpool {

std::unique_ptr<Connection> SQLiteDriver::connect(const ConnectionConfig& config) {
    const std::string& dbPath = config.database;
    if (dbPath.empty()) {
        throw ConnectError("SQLite database path is empty");
    }

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(dbPath.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) {
            sqlite3_close_v2(db);
        }
        throw ConnectError("Failed to open SQLite database '" + dbPath + "': " + msg, rc);
    }

    auto busyMs = config.connect_timeout.count();
    sqlite3_busy_timeout(db, busyMs > INT_MAX ? INT_MAX : static_cast<int>(busyMs));

    spdlog::debug("Opened SQLite database '{}'", dbPath);
    return std::make_unique<SQLiteConnection>(db, dbPath);
}

}  // namespace sqlpool
