#pragma once

/**
 * @file MySQLDriver.hpp
 * @brief Opens libmysqlclient sessions for the connection pool.
 */

#include "Driver.hpp"

namespace sqlpool {

/**
 * @class MySQLDriver
 * @brief Driver backed by mysql_real_connect().
 *
 * The first instance runs mysql_library_init() exactly once per process.
 * Port 0 selects 3306. Connections use utf8mb4 and CLIENT_MULTI_STATEMENTS.
 */
class MySQLDriver : public Driver {
public:
    MySQLDriver();

    /**
     * @brief Create and connect a new handle.
     * @throws ConnectError carrying mysql_errno() on failure.
     */
    std::unique_ptr<Connection> connect(const ConnectionConfig& config) override;

    std::string name() const override { return "mysql"; }
};

}  // namespace sqlpool
