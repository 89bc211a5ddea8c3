#pragma once

/**
 * @file MySQLConnection.hpp
 * @brief Pool-managed wrapper for a libmysqlclient MYSQL handle.
 */

#include "Driver.hpp"
#include <mysql/mysql.h>
#include <string>

namespace sqlpool {

/**
 * @class MySQLConnection
 * @brief RAII owner of one MYSQL handle.
 *
 * Thread Safety:
 * - Individual connections are NOT thread-safe; the pool lends each one
 *   to a single caller at a time.
 */
class MySQLConnection : public Connection {
public:
    /**
     * @brief Take ownership of a connected handle.
     * @param conn Handle that mysql_real_connect() succeeded on.
     */
    explicit MySQLConnection(MYSQL* conn);

    /**
     * @brief Destructor - calls mysql_close if the handle is still open.
     */
    ~MySQLConnection() override;

    /**
     * @brief Ping the server to verify connectivity.
     * @return true if mysql_ping() succeeds.
     */
    bool validate() noexcept override;

    void close() override;

    /**
     * @brief Execute a SQL statement, discarding any result set.
     * @return true on success, false on error (logged).
     */
    bool execute(const std::string& sql) override;

    bool isOpen() const override { return m_conn != nullptr; }
    std::string backend() const override { return "mysql"; }

private:
    MYSQL* m_conn;  ///< MySQL connection handle
};

}  // namespace sqlpool
