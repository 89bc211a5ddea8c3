#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace sqlpool {

enum class DatabaseType {
    SQLite,
    PostgreSQL,
    MySQL
};

// Accepts sqlite, sqlite3, postgresql, postgres, pgsql, mysql (case-insensitive).
// Throws ConfigError on anything else.
DatabaseType parseDatabaseType(const std::string& name);
std::string toString(DatabaseType type);

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 0;  // 0 selects the backend's default port
    std::string user;
    std::string password;
    std::string socket;
    std::string database;  // SQLite: file path or ":memory:"

    // SSL options
    bool use_ssl = false;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;

    // Timeouts
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds write_timeout{30000};
};

struct PoolConfig {
    int64_t min_size = 1;
    int64_t max_size = 10;
    std::chrono::milliseconds health_check_interval{60000};  // 0 disables
    std::chrono::milliseconds acquire_timeout{30000};
    int64_t spin_iterations = 10;

    // Throws ConfigError when a bound is violated
    void validate() const;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    DatabaseType database_type = DatabaseType::SQLite;
    ConnectionConfig connection;
    PoolConfig pool;
    LoggingConfig logging;

    // Load from INI file; nullopt if the file cannot be opened.
    // Throws ConfigError on malformed values.
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();
};

}  // namespace sqlpool
