#include "BenchOptions.hpp"
#include "BenchRunner.hpp"
#include "ConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include "MetricsReport.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <string>
#include <vector>

using namespace sqlpool;

namespace {

void setupLogging(const std::string& levelName, const std::string& logFile) {
    try {
        auto level = spdlog::level::from_str(levelName);
        std::vector<spdlog::sink_ptr> sinks;

        // Console logging goes to stderr so --json output stays parseable
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sql-pool", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

bool wants(const std::string& scenario, const char* name) {
    return scenario == "all" || scenario == name;
}

void printChurn(const std::vector<ChurnResult>& results, const PoolConfig& pool, json& out,
                bool asJson, const char* key) {
    json arr = json::array();
    for (const auto& r : results) {
        if (asJson) {
            arr.push_back(BenchRunner::toJSON(r));
            continue;
        }
        std::cout << BenchRunner::toText(r);
        PoolConfig sized = pool;
        sized.max_size = r.options.maxSize;
        for (const auto& hint : MetricsReport::advise(r.metrics, sized)) {
            std::cout << "  Note: " << hint << "\n";
        }
        std::cout << std::endl;
    }
    if (asJson) {
        out[key] = arr;
    }
}

int run(const BenchOptions& options) {
    const Config& config = options.config;
    auto driver = makeDriver(config.database_type);
    BenchRunner runner(driver, config.connection, config.pool);

    json out = json::object();
    out["backend"] = toString(config.database_type);

    if (wants(options.scenario, "churn")) {
        if (!options.json) std::cout << "=== High churn ===\n\n";
        std::vector<ChurnResult> results;
        for (const auto& scenario : BenchRunner::churnScenarios()) {
            results.push_back(runner.runChurn(scenario));
        }
        printChurn(results, config.pool, out, options.json, "churn");

        if (!options.json && results.size() > 1 && results.front().avgOpMs > 0.0) {
            std::cout << "Slowdown of '" << results.back().options.label << "' vs '"
                      << results.front().options.label << "': "
                      << results.back().avgOpMs / results.front().avgOpMs << "x\n\n";
        }
    }

    if (wants(options.scenario, "spin-park")) {
        if (!options.json) std::cout << "=== Spin vs park ===\n\n";
        std::vector<ChurnResult> results;
        for (const auto& scenario : BenchRunner::spinParkScenarios()) {
            results.push_back(runner.runChurn(scenario));
        }
        printChurn(results, config.pool, out, options.json, "spin_park");
    }

    if (wants(options.scenario, "timeout-scaling")) {
        if (!options.json) std::cout << "=== Timeout scaling ===\n\n";
        json arr = json::array();
        auto timeout = std::chrono::milliseconds(options.waiterTimeoutMs);
        for (int waiters : BenchRunner::timeoutScalingWaiters()) {
            auto r = runner.runTimeoutScaling(waiters, timeout);
            if (options.json) {
                arr.push_back(BenchRunner::toJSON(r));
            } else {
                std::cout << BenchRunner::toText(r);
            }
        }
        if (options.json) {
            out["timeout_scaling"] = arr;
        } else {
            std::cout << std::endl;
        }
    }

    if (options.scenario == "custom") {
        ChurnOptions custom;
        custom.label = "custom";
        custom.minSize = config.pool.min_size;
        custom.maxSize = config.pool.max_size;
        custom.threads = options.threads;
        custom.opsPerThread = options.opsPerThread;
        custom.hold = std::chrono::microseconds(options.holdMicros);
        custom.timeout = config.pool.acquire_timeout;
        printChurn({runner.runChurn(custom)}, config.pool, out, options.json, "custom");
    }

    if (options.json) {
        std::cout << out.dump(2) << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-V" || arg == "--version") {
            std::cout << "sqlpool-bench version 1.0.0" << std::endl;
            return 0;
        }
    }

    // Parse configuration
    BenchOptions options;
    try {
        options = BenchOptions::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(options.config.logging.level, options.config.logging.file);

    spdlog::info("Starting sqlpool-bench ({} backend, scenario '{}')",
                 toString(options.config.database_type), options.scenario);

    // Validate configuration
    if (!options.config.validate()) {
        return 1;
    }

    try {
        return run(options);
    } catch (const PoolException& e) {
        spdlog::error("Benchmark failed: {} (errno {})", e.what(), e.posixError());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Benchmark failed: {}", e.what());
        return 1;
    }
}
