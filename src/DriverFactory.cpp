#include "Driver.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

#ifdef SQLPOOL_WITH_SQLITE
#include "SQLiteDriver.hpp"
#endif

#ifdef SQLPOOL_WITH_POSTGRESQL
#include "PostgreSQLDriver.hpp"
#endif

#ifdef SQLPOOL_WITH_MYSQL
#include "MySQLDriver.hpp"
#endif

namespace sqlpool {

std::shared_ptr<Driver> makeDriver(DatabaseType type) {
    spdlog::debug("Creating driver for {}", toString(type));

    switch (type) {
#ifdef SQLPOOL_WITH_SQLITE
        case DatabaseType::SQLite:
            return std::make_shared<SQLiteDriver>();
#else
        case DatabaseType::SQLite:
            throw ConfigError("SQLite support is not compiled in");
#endif

#ifdef SQLPOOL_WITH_POSTGRESQL
        case DatabaseType::PostgreSQL:
            return std::make_shared<PostgreSQLDriver>();
#else
        case DatabaseType::PostgreSQL:
            throw ConfigError("PostgreSQL support is not compiled in");
#endif

#ifdef SQLPOOL_WITH_MYSQL
        case DatabaseType::MySQL:
            return std::make_shared<MySQLDriver>();
#else
        case DatabaseType::MySQL:
            throw ConfigError("MySQL support is not compiled in");
#endif
    }

    throw ConfigError("Unknown database type");
}

}  // namespace sqlpool
