#include "BenchOptions.hpp"
#include "ErrorHandler.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>

namespace sqlpool {

BenchOptions BenchOptions::parseArgs(int argc, char* argv[]) {
    BenchOptions options;

    CLI::App app{"sqlpool-bench - Measure connection pool contention behaviour"};

    app.add_option("scenario", options.scenario,
                   "Scenario: churn, spin-park, timeout-scaling, custom, all")
        ->check(CLI::IsMember({"churn", "spin-park", "timeout-scaling", "custom", "all"}))
        ->default_val("all");

    // Database type option
    std::string type = "sqlite";
    app.add_option("-t,--type", type, "Database type (sqlite, postgresql, mysql)")
        ->default_val("sqlite");

    // Connection options
    std::string host;
    uint16_t port = 0;
    std::string user;
    std::string password;
    std::string socket;
    std::string database;
    app.add_option("-H,--host", host, "Database server host");
    app.add_option("-P,--port", port, "Database server port (0 = backend default)");
    app.add_option("-u,--user", user, "Database username");
    app.add_option("-p,--password", password, "Database password");
    app.add_option("-S,--socket", socket, "Unix socket path");
    app.add_option("-D,--database", database, "Database name (or SQLite file path)");

    // Pool options
    int64_t minSize = -1;
    int64_t maxSize = -1;
    int64_t spin = -1;
    app.add_option("--min-size", minSize, "Minimum pool size (custom scenario)");
    app.add_option("--max-size", maxSize, "Maximum pool size (custom scenario)");
    app.add_option("--spin", spin, "Spin iterations before parking");

    // Workload options
    app.add_option("--threads", options.threads, "Worker threads (custom scenario)")
        ->check(CLI::PositiveNumber);
    app.add_option("--ops", options.opsPerThread, "Operations per thread (custom scenario)")
        ->check(CLI::PositiveNumber);
    app.add_option("--hold-us", options.holdMicros, "Microseconds a connection is held per operation")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--waiter-timeout", options.waiterTimeoutMs,
                   "Acquire timeout in ms for timeout-scaling")
        ->check(CLI::PositiveNumber);

    // Output options
    app.add_flag("--json", options.json, "Print results as JSON");
    app.add_flag("-d,--debug", options.debug, "Enable debug output");
    std::string logFile;
    app.add_option("--log-file", logFile, "Also write the log to this file");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Load config file if specified, command line args override it
    if (!config_file.empty()) {
        auto file_config = Config::loadFromFile(config_file);
        if (file_config) {
            options.config = *file_config;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    if (config_file.empty() || app.count("--type") > 0) {
        options.config.database_type = parseDatabaseType(type);
    }
    if (!host.empty()) options.config.connection.host = host;
    if (port != 0) options.config.connection.port = port;
    if (!user.empty()) options.config.connection.user = user;
    if (!password.empty()) options.config.connection.password = password;
    if (!socket.empty()) options.config.connection.socket = socket;
    if (!database.empty()) options.config.connection.database = database;

    if (minSize >= 0) options.config.pool.min_size = minSize;
    if (maxSize >= 0) options.config.pool.max_size = maxSize;
    if (spin >= 0) options.config.pool.spin_iterations = spin;

    if (!logFile.empty()) options.config.logging.file = logFile;
    if (options.debug) options.config.logging.level = "debug";

    // SQLite defaults to a private in-memory database per connection
    if (options.config.database_type == DatabaseType::SQLite &&
        options.config.connection.database.empty()) {
        options.config.connection.database = ":memory:";
    }

    // Resolve password from environment if not set
    options.config.resolvePassword();

    return options;
}

}  // namespace sqlpool
