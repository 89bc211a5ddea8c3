#pragma once

/**
 * @file SQLiteDriver.hpp
 * @brief Opens SQLite database files for the connection pool.
 */

#include "Driver.hpp"

namespace sqlpool {

/**
 * @class SQLiteDriver
 * @brief Driver that opens ConnectionConfig::database as an SQLite file.
 *
 * Files are opened with SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
 * SQLITE_OPEN_FULLMUTEX. ":memory:" gives every connection its own private
 * in-memory database. connect_timeout is applied as the busy timeout.
 */
class SQLiteDriver : public Driver {
public:
    SQLiteDriver() = default;

    /**
     * @brief Open the database file.
     * @throws ConnectError if sqlite3_open_v2 fails or no path is configured.
     */
    std::unique_ptr<Connection> connect(const ConnectionConfig& config) override;

    std::string name() const override { return "sqlite"; }
};

}  // namespace sqlpool
