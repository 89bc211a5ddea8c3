#pragma once

/**
 * @file Driver.hpp
 * @brief Backend-neutral connection capability consumed by ConnectionPool.
 *
 * A Driver knows how to open a Connection to one kind of backend. The pool
 * only ever talks to these two interfaces, so SQLite, PostgreSQL and MySQL
 * share the same acquisition logic.
 */

#include "Config.hpp"
#include <memory>
#include <string>

namespace sqlpool {

/**
 * @class Connection
 * @brief An established session with a database backend.
 *
 * Connections are owned by a ConnectionPool slot and lent to exactly one
 * caller at a time. Implementations do not need to be thread-safe.
 */
class Connection {
public:
    virtual ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Check that the session still answers.
     * @return false if the backend is unreachable or the handle is broken.
     *
     * Never throws; failure is reported through the return value.
     */
    virtual bool validate() noexcept = 0;

    /**
     * @brief Close the session. Safe to call more than once.
     * @throws std::exception if the backend reports a close failure.
     */
    virtual void close() = 0;

    /**
     * @brief Run a statement that returns no rows.
     * @return true on success; the error is logged on failure.
     */
    virtual bool execute(const std::string& sql) = 0;

    // True until close() has been called
    virtual bool isOpen() const = 0;

    // Backend name for log lines ("sqlite", "postgresql", "mysql")
    virtual std::string backend() const = 0;

protected:
    Connection() = default;
};

/**
 * @class Driver
 * @brief Factory for Connections to one backend.
 *
 * connect() is called outside the pool's lock and may block for up to
 * ConnectionConfig::connect_timeout.
 */
class Driver {
public:
    virtual ~Driver() = default;

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    /**
     * @brief Open a new connection.
     * @throws ConnectError if the backend refuses or cannot be reached.
     */
    virtual std::unique_ptr<Connection> connect(const ConnectionConfig& config) = 0;

    virtual std::string name() const = 0;

protected:
    Driver() = default;
};

// Create the driver for a backend. Throws ConfigError if the backend
// was not compiled in.
std::shared_ptr<Driver> makeDriver(DatabaseType type);

}  // namespace sqlpool
