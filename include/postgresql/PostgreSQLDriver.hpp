#pragma once

/**
 * @file PostgreSQLDriver.hpp
 * @brief Opens libpq sessions for the connection pool.
 */

#include "Driver.hpp"
#include <string>

namespace sqlpool {

/**
 * @class PostgreSQLDriver
 * @brief Driver backed by libpq's blocking PQconnectdb().
 *
 * The ConnectionConfig is rendered as a libpq conninfo string. Port 0
 * selects 5432. SSL is "require" when use_ssl is set, otherwise "prefer".
 */
class PostgreSQLDriver : public Driver {
public:
    PostgreSQLDriver() = default;

    /**
     * @brief Connect to the server.
     * @throws ConnectError with PQerrorMessage() when the status is not CONNECTION_OK.
     */
    std::unique_ptr<Connection> connect(const ConnectionConfig& config) override;

    std::string name() const override { return "postgresql"; }

    /**
     * @brief Build the libpq conninfo string for a configuration.
     *
     * Values are single-quoted and escaped as libpq requires, so passwords
     * containing spaces survive.
     */
    static std::string buildConnInfo(const ConnectionConfig& config);
};

}  // namespace sqlpool
