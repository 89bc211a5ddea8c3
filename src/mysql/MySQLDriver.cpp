#include "MySQLDriver.hpp"
#include "MySQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <mysql/mysql.h>
#include <spdlog/spdlog.h>
#include <mutex>

namespace sqlpool {

namespace {

constexpr unsigned int kDefaultPort = 3306;

unsigned int toSeconds(std::chrono::milliseconds timeout) {
    auto seconds = timeout.count() / 1000;
    return seconds < 1 ? 1u : static_cast<unsigned int>(seconds);
}

}  // namespace

MySQLDriver::MySQLDriver() {
    // Initialize MySQL library (thread-safe)
    static std::once_flag mysqlInitFlag;
    std::call_once(mysqlInitFlag, []() {
        if (mysql_library_init(0, nullptr, nullptr) != 0) {
            spdlog::error("mysql_library_init failed");
        }
    });
}

std::unique_ptr<Connection> MySQLDriver::connect(const ConnectionConfig& config) {
    MYSQL* conn = mysql_init(nullptr);
    if (!conn) {
        throw ConnectError("Failed to initialize MySQL connection");
    }

    // Set options
    unsigned int timeout = toSeconds(config.connect_timeout);
    mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    unsigned int readTimeout = toSeconds(config.read_timeout);
    mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &readTimeout);

    unsigned int writeTimeout = toSeconds(config.write_timeout);
    mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &writeTimeout);

    // SSL options
    if (config.use_ssl) {
        mysql_ssl_set(conn,
                     config.ssl_key.empty() ? nullptr : config.ssl_key.c_str(),
                     config.ssl_cert.empty() ? nullptr : config.ssl_cert.c_str(),
                     config.ssl_ca.empty() ? nullptr : config.ssl_ca.c_str(),
                     nullptr, nullptr);
    }

    // Connect
    const char* socket = config.socket.empty() ? nullptr : config.socket.c_str();
    const char* db = config.database.empty() ? nullptr : config.database.c_str();
    unsigned int port = config.port == 0 ? kDefaultPort : config.port;

    if (!mysql_real_connect(conn,
                            config.host.c_str(),
                            config.user.c_str(),
                            config.password.c_str(),
                            db,
                            port,
                            socket,
                            CLIENT_MULTI_STATEMENTS)) {
        unsigned int err = mysql_errno(conn);
        std::string msg = mysql_error(conn);
        mysql_close(conn);
        throw ConnectError("Failed to connect to MySQL: " + msg, static_cast<int>(err));
    }

    // Set character set to UTF-8
    mysql_set_character_set(conn, "utf8mb4");

    spdlog::debug("Connected to MySQL {}:{}", config.host, port);
    return std::make_unique<MySQLConnection>(conn);
}

}  // namespace sqlpool
