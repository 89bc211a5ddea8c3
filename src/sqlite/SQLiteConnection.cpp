/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of the pool-managed SQLite connection.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlpool {

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(sqlite3* db, std::string dbPath)
    : m_db(db), m_path(std::move(dbPath)) {
}

SQLiteConnection::~SQLiteConnection() {
    // Close database handle if open
    if (m_db) {
        sqlite3_close_v2(m_db);
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool SQLiteConnection::validate() noexcept {
    if (!m_db) return false;

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT 1", -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::debug("SQLite validation failed for '{}': {}", m_path, sqlite3_errmsg(m_db));
        return false;
    }
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_ROW;
}

void SQLiteConnection::close() {
    if (!m_db) return;

    int rc = sqlite3_close_v2(m_db);
    if (rc != SQLITE_OK) {
        throw ConnectError("Failed to close SQLite database '" + m_path + "': " +
                           sqlite3_errmsg(m_db), rc);
    }
    m_db = nullptr;
}

// ============================================================================
// Query Execution
// ============================================================================

bool SQLiteConnection::execute(const std::string& sql) {
    if (!m_db) return false;

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        spdlog::error("SQLite exec failed: {}", errMsg ? errMsg : "unknown");
        if (errMsg) sqlite3_free(errMsg);
        return false;
    }
    return true;
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_errcode(m_db) : SQLITE_ERROR;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace sqlpool
