#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief Pool-managed wrapper for a libpq PGconn handle.
 */

#include "Driver.hpp"
#include <libpq-fe.h>
#include <string>

namespace sqlpool {

/**
 * @class PostgreSQLConnection
 * @brief RAII owner of one PGconn.
 *
 * Connection Validation:
 * - validate() checks PQstatus and then runs "SELECT 1" so that a server
 *   which dropped the session is detected before the handle is lent out
 *
 * Thread Safety:
 * - Individual connections should not be shared between threads
 * - The pool handles thread-safe connection distribution
 */
class PostgreSQLConnection : public Connection {
public:
    explicit PostgreSQLConnection(PGconn* conn);

    /**
     * @brief Destructor - calls PQfinish if the handle is still open.
     */
    ~PostgreSQLConnection() override;

    bool validate() noexcept override;
    void close() override;

    /**
     * @brief Execute a command that returns no rows.
     * @return true if the result status is COMMAND_OK or TUPLES_OK.
     */
    bool execute(const std::string& sql) override;

    bool isOpen() const override { return m_conn != nullptr; }
    std::string backend() const override { return "postgresql"; }

private:
    PGconn* m_conn;  ///< libpq connection handle
};

}  // namespace sqlpool
