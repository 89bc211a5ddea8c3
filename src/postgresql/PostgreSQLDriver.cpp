/**
 * @file PostgreSQLDriver.cpp
 * @brief Implementation of the PostgreSQL driver.
 *
 * Uses libpq connection strings for configuration and supports SSL
 * connections.
 */

#include "PostgreSQLDriver.hpp"
#include "PostgreSQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <libpq-fe.h>
#include <spdlog/spdlog.h>
#include <sstream>

namespace sqlpool {

namespace {

constexpr uint16_t kDefaultPort = 5432;

// Quote a conninfo value: 'it\'s'
std::string quote(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

}  // namespace

// ============================================================================
// Connection String
// ============================================================================

std::string PostgreSQLDriver::buildConnInfo(const ConnectionConfig& config) {
    std::ostringstream connInfo;

    // A socket directory takes the place of the host name in libpq
    connInfo << "host=" << quote(config.socket.empty() ? config.host : config.socket);
    connInfo << " port=" << (config.port == 0 ? kDefaultPort : config.port);

    if (!config.user.empty()) {
        connInfo << " user=" << quote(config.user);
    }

    if (!config.password.empty()) {
        connInfo << " password=" << quote(config.password);
    }

    if (!config.database.empty()) {
        connInfo << " dbname=" << quote(config.database);
    }

    // Timeout in seconds, libpq treats 0 as "wait forever"
    auto timeoutSec = config.connect_timeout.count() / 1000;
    connInfo << " connect_timeout=" << (timeoutSec < 1 ? 1 : timeoutSec);

    // SSL options
    if (config.use_ssl) {
        connInfo << " sslmode=require";
        if (!config.ssl_ca.empty()) {
            connInfo << " sslrootcert=" << quote(config.ssl_ca);
        }
        if (!config.ssl_cert.empty()) {
            connInfo << " sslcert=" << quote(config.ssl_cert);
        }
        if (!config.ssl_key.empty()) {
            connInfo << " sslkey=" << quote(config.ssl_key);
        }
    } else {
        connInfo << " sslmode=prefer";
    }

    // Application name for identification
    connInfo << " application_name=sql-pool";

    return connInfo.str();
}

// ============================================================================
// Connection Creation
// ============================================================================

std::unique_ptr<Connection> PostgreSQLDriver::connect(const ConnectionConfig& config) {
    PGconn* conn = PQconnectdb(buildConnInfo(config).c_str());

    if (!conn) {
        throw ConnectError("Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string errorMsg = PQerrorMessage(conn);
        PQfinish(conn);
        throw ConnectError("Failed to connect to PostgreSQL: " + errorMsg);
    }

    // Set client encoding to UTF-8
    PQsetClientEncoding(conn, "UTF8");

    spdlog::debug("Connected to PostgreSQL {}:{}", config.host,
                  config.port == 0 ? kDefaultPort : config.port);
    return std::make_unique<PostgreSQLConnection>(conn);
}

}  // namespace sqlpool
