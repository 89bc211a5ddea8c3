#include "Config.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <limits>

namespace sqlpool {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool parseBool(const std::string& value) {
    std::string v = toLower(value);
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

int64_t parseInt(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    int64_t result = 0;
    try {
        result = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for '" + key + "': " + value);
    }
    if (consumed != value.size()) {
        throw ConfigError("Invalid integer for '" + key + "': " + value);
    }
    return result;
}

std::chrono::milliseconds parseMillis(const std::string& key, const std::string& value) {
    std::string v = toLower(value);
    if (v == "none" || v == "infinite" || v == "forever") {
        return std::chrono::milliseconds::max();
    }
    return std::chrono::milliseconds(parseInt(key, value));
}

}  // namespace

DatabaseType parseDatabaseType(const std::string& name) {
    std::string type = toLower(trim(name));
    if (type == "sqlite" || type == "sqlite3") return DatabaseType::SQLite;
    if (type == "postgresql" || type == "postgres" || type == "pgsql") return DatabaseType::PostgreSQL;
    if (type == "mysql") return DatabaseType::MySQL;
    throw ConfigError("Unknown database type: " + name);
}

std::string toString(DatabaseType type) {
    switch (type) {
        case DatabaseType::SQLite: return "sqlite";
        case DatabaseType::PostgreSQL: return "postgresql";
        case DatabaseType::MySQL: return "mysql";
    }
    return "unknown";
}

void PoolConfig::validate() const {
    if (min_size < 0) {
        throw ConfigError("min_size must be >= 0, got " + std::to_string(min_size));
    }
    if (max_size < min_size) {
        throw ConfigError("max_size must be >= min_size, got max_size=" +
                          std::to_string(max_size) + ", min_size=" + std::to_string(min_size));
    }
    if (max_size < 1) {
        throw ConfigError("max_size must be >= 1, got " + std::to_string(max_size));
    }
    if (health_check_interval.count() < 0) {
        throw ConfigError("health_check_interval must be >= 0, got " +
                          std::to_string(health_check_interval.count()) + "ms");
    }
    if (acquire_timeout.count() < 0) {
        throw ConfigError("acquire_timeout must be >= 0, got " +
                          std::to_string(acquire_timeout.count()) + "ms");
    }
    if (spin_iterations < 0) {
        throw ConfigError("spin_iterations must be >= 0, got " + std::to_string(spin_iterations));
    }
}

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = toLower(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Apply to appropriate section
        if (current_section == "connection") {
            if (key == "type") config.database_type = parseDatabaseType(value);
            else if (key == "host") config.connection.host = value;
            else if (key == "port") {
                int64_t port = parseInt(key, value);
                if (port < 0 || port > std::numeric_limits<uint16_t>::max()) {
                    throw ConfigError("Port out of range: " + value);
                }
                config.connection.port = static_cast<uint16_t>(port);
            }
            else if (key == "user") config.connection.user = value;
            else if (key == "password") config.connection.password = value;
            else if (key == "socket") config.connection.socket = value;
            else if (key == "database") config.connection.database = value;
            else if (key == "use_ssl") config.connection.use_ssl = parseBool(value);
            else if (key == "ssl_ca") config.connection.ssl_ca = value;
            else if (key == "ssl_cert") config.connection.ssl_cert = value;
            else if (key == "ssl_key") config.connection.ssl_key = value;
            else if (key == "connect_timeout")
                config.connection.connect_timeout = parseMillis(key, value);
            else if (key == "read_timeout")
                config.connection.read_timeout = parseMillis(key, value);
            else if (key == "write_timeout")
                config.connection.write_timeout = parseMillis(key, value);
            else spdlog::warn("Unknown key '{}' in [connection]", key);
        }
        else if (current_section == "pool") {
            if (key == "min_size") config.pool.min_size = parseInt(key, value);
            else if (key == "max_size") config.pool.max_size = parseInt(key, value);
            else if (key == "health_check_interval")
                config.pool.health_check_interval = parseMillis(key, value);
            else if (key == "acquire_timeout")
                config.pool.acquire_timeout = parseMillis(key, value);
            else if (key == "spin_iterations") config.pool.spin_iterations = parseInt(key, value);
            else spdlog::warn("Unknown key '{}' in [pool]", key);
        }
        else if (current_section == "logging") {
            if (key == "level") config.logging.level = toLower(value);
            else if (key == "file") config.logging.file = value;
            else spdlog::warn("Unknown key '{}' in [logging]", key);
        }
    }

    return config;
}

bool Config::validate() const {
    try {
        pool.validate();
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return false;
    }

    if (database_type == DatabaseType::SQLite) {
        if (connection.database.empty()) {
            spdlog::error("SQLite requires a database path (use -D option)");
            return false;
        }
    } else if (connection.user.empty()) {
        // Username is required for server backends, optional for SQLite
        spdlog::error("Database username is required (use -u option)");
        return false;
    }

    if (connection.use_ssl) {
        if (!connection.ssl_ca.empty() && !std::filesystem::exists(connection.ssl_ca)) {
            spdlog::error("SSL CA file not found: {}", connection.ssl_ca);
            return false;
        }
        if (!connection.ssl_cert.empty() && !std::filesystem::exists(connection.ssl_cert)) {
            spdlog::error("SSL certificate file not found: {}", connection.ssl_cert);
            return false;
        }
        if (!connection.ssl_key.empty() && !std::filesystem::exists(connection.ssl_key)) {
            spdlog::error("SSL key file not found: {}", connection.ssl_key);
            return false;
        }
    }

    return true;
}

void Config::resolvePassword() {
    if (!connection.password.empty()) {
        return;
    }

    const char* env_pwd = std::getenv("SQLPOOL_PASSWORD");
    if (!env_pwd) {
        if (database_type == DatabaseType::PostgreSQL) {
            env_pwd = std::getenv("PGPASSWORD");
        } else if (database_type == DatabaseType::MySQL) {
            env_pwd = std::getenv("MYSQL_PWD");
        }
    }
    if (env_pwd) {
        connection.password = env_pwd;
    }
}

}  // namespace sqlpool
