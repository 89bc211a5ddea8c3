#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief Pool-managed wrapper for an SQLite database handle.
 *
 * SQLite is file-based, so "connecting" means opening the database file.
 * Pooling still pays off because every open re-reads the schema and
 * re-establishes file locks.
 */

#include "Driver.hpp"
#include <sqlite3.h>
#include <string>
#include <cstdint>

namespace sqlpool {

/**
 * @class SQLiteConnection
 * @brief RAII owner of one sqlite3 handle.
 *
 * Created by SQLiteDriver::connect() with an already-open handle. The handle
 * is closed by close() or, failing that, by the destructor.
 *
 * Thread Safety:
 * - Opened with SQLITE_OPEN_FULLMUTEX, but the pool still lends each
 *   connection to one caller at a time
 */
class SQLiteConnection : public Connection {
public:
    /**
     * @brief Take ownership of an open sqlite3 handle.
     * @param db Handle returned by sqlite3_open_v2().
     * @param dbPath Path the handle was opened with (for log lines).
     */
    SQLiteConnection(sqlite3* db, std::string dbPath);

    /**
     * @brief Destructor - closes the database handle if still open.
     */
    ~SQLiteConnection() override;

    /**
     * @brief Check connectivity with a trivial query.
     * @return true if "SELECT 1" succeeds.
     */
    bool validate() noexcept override;

    /**
     * @brief Close the handle with sqlite3_close_v2().
     * @throws ConnectError if SQLite refuses to close the handle.
     */
    void close() override;

    /**
     * @brief Execute a SQL statement without returning results.
     * @param sql The SQL statement to execute.
     * @return true on success, false on error (check error() for details).
     */
    bool execute(const std::string& sql) override;

    bool isOpen() const override { return m_db != nullptr; }
    std::string backend() const override { return "sqlite"; }

    /**
     * @brief Get the underlying sqlite3 handle.
     * @return Raw sqlite3* pointer (still owned by this object).
     */
    sqlite3* get() const { return m_db; }

    const std::string& path() const { return m_path; }

    /**
     * @brief Get the last SQLite error message.
     * @return Error description from the last failed operation.
     */
    const char* error() const;

    /**
     * @brief Get the last SQLite error code.
     * @return SQLite error code (SQLITE_OK = 0, SQLITE_ERROR = 1, etc.).
     */
    int errorCode() const;

    /**
     * @brief Get the number of rows changed by the last statement.
     * @return Number of rows inserted, updated, or deleted.
     */
    int changes() const;

private:
    sqlite3* m_db = nullptr;  ///< SQLite database handle
    std::string m_path;       ///< Path to database file
};

}  // namespace sqlpool
