#include "BenchRunner.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>

namespace sqlpool {

namespace {

using Clock = std::chrono::steady_clock;

double secondsSince(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

// Joins every thread even if one of them stored an exception
void joinAll(std::vector<std::thread>& threads) {
    for (auto& t : threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

}  // namespace

BenchRunner::BenchRunner(std::shared_ptr<Driver> driver, ConnectionConfig connConfig, PoolConfig base)
    : m_driver(std::move(driver)), m_connConfig(std::move(connConfig)), m_base(base) {
}

// ============================================================================
// Scenario Sets
// ============================================================================

std::vector<ChurnOptions> BenchRunner::churnScenarios() {
    using namespace std::chrono_literals;
    return {
        {.label = "baseline", .minSize = 10, .maxSize = 10, .threads = 10, .opsPerThread = 100, .hold = 1ms},
        {.label = "moderate", .minSize = 5, .maxSize = 5, .threads = 25, .opsPerThread = 100, .hold = 1ms},
        {.label = "high", .minSize = 2, .maxSize = 2, .threads = 50, .opsPerThread = 50, .hold = 1ms},
        {.label = "extreme", .minSize = 2, .maxSize = 2, .threads = 100, .opsPerThread = 20, .hold = 1ms},
    };
}

std::vector<ChurnOptions> BenchRunner::spinParkScenarios() {
    using namespace std::chrono_literals;
    return {
        {.label = "low-contention", .minSize = 3, .maxSize = 5, .threads = 10, .opsPerThread = 100, .hold = 100us},
        {.label = "high-contention", .minSize = 1, .maxSize = 2, .threads = 20, .opsPerThread = 50, .hold = 1ms},
    };
}

// ============================================================================
// Churn
// ============================================================================

ChurnResult BenchRunner::runChurn(const ChurnOptions& options) {
    PoolConfig poolConfig = m_base;
    poolConfig.min_size = options.minSize;
    poolConfig.max_size = options.maxSize;
    poolConfig.acquire_timeout = options.timeout;

    ConnectionPool pool(m_driver, m_connConfig, poolConfig);
    spdlog::info("Running churn scenario '{}': pool {}..{}, {} threads x {} ops",
                 options.label, options.minSize, options.maxSize,
                 options.threads, options.opsPerThread);

    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> timedOut{0};
    std::vector<std::exception_ptr> errors(static_cast<size_t>(options.threads));
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(options.threads));

    auto start = Clock::now();
    for (int i = 0; i < options.threads; ++i) {
        threads.emplace_back([&, i]() {
            try {
                for (int op = 0; op < options.opsPerThread; ++op) {
                    try {
                        pool.withConnection(options.timeout, [&](Connection&) {
                            std::this_thread::sleep_for(options.hold);
                        });
                        completed.fetch_add(1, std::memory_order_relaxed);
                    } catch (const TimeoutError&) {
                        // Possible under extreme contention
                        timedOut.fetch_add(1, std::memory_order_relaxed);
                    }
                }
            } catch (const std::exception&) {
                errors[static_cast<size_t>(i)] = std::current_exception();
            }
        });
    }
    joinAll(threads);

    ChurnResult result;
    result.options = options;
    result.elapsedSec = secondsSince(start);
    result.completed = completed.load();
    result.timedOut = timedOut.load();
    result.metrics = pool.getMetrics();

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    uint64_t attempted = static_cast<uint64_t>(options.threads) * static_cast<uint64_t>(options.opsPerThread);
    if (result.elapsedSec > 0.0) {
        result.throughput = static_cast<double>(result.completed) / result.elapsedSec;
    }
    if (attempted > 0) {
        result.avgOpMs = result.elapsedSec * 1000.0 / static_cast<double>(attempted);
    }
    return result;
}

// ============================================================================
// Timeout Scaling
// ============================================================================

TimeoutScalingResult BenchRunner::runTimeoutScaling(int waiters, std::chrono::milliseconds timeout) {
    PoolConfig poolConfig = m_base;
    poolConfig.min_size = 1;
    poolConfig.max_size = 1;

    ConnectionPool pool(m_driver, m_connConfig, poolConfig);
    auto holder = pool.lease();

    spdlog::info("Running timeout scaling with {} waiters ({}ms timeout)", waiters, timeout.count());

    std::vector<double> durations(static_cast<size_t>(waiters), 0.0);
    std::vector<std::exception_ptr> errors(static_cast<size_t>(waiters));
    std::atomic<uint64_t> timedOut{0};
    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(waiters));

    for (int i = 0; i < waiters; ++i) {
        threads.emplace_back([&, i]() {
            auto start = Clock::now();
            try {
                auto conn = pool.acquire(timeout);
                pool.release(conn);
            } catch (const TimeoutError&) {
                timedOut.fetch_add(1, std::memory_order_relaxed);
            } catch (const std::exception&) {
                errors[static_cast<size_t>(i)] = std::current_exception();
            }
            durations[static_cast<size_t>(i)] = secondsSince(start) * 1000.0;
        });
    }
    joinAll(threads);
    holder.release();

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    TimeoutScalingResult result;
    result.waiters = waiters;
    result.timeout = timeout;
    result.timedOut = timedOut.load();
    result.metrics = pool.getMetrics();

    if (!durations.empty()) {
        double total = 0.0;
        double timeoutMs = static_cast<double>(timeout.count());
        for (double d : durations) {
            total += d;
            result.maxOvershootMs = std::max(result.maxOvershootMs, d - timeoutMs);
        }
        result.avgCallMs = total / static_cast<double>(durations.size());
        result.avgOvershootMs = result.avgCallMs - timeoutMs;
    }
    return result;
}

// ============================================================================
// Reporting
// ============================================================================

json BenchRunner::toJSON(const ChurnResult& r) {
    json obj = json::object();
    obj["scenario"] = r.options.label;
    obj["min_size"] = r.options.minSize;
    obj["max_size"] = r.options.maxSize;
    obj["threads"] = r.options.threads;
    obj["ops_per_thread"] = r.options.opsPerThread;
    obj["hold_us"] = r.options.hold.count();
    obj["elapsed_sec"] = r.elapsedSec;
    obj["throughput"] = r.throughput;
    obj["avg_op_ms"] = r.avgOpMs;
    obj["completed"] = r.completed;
    obj["timed_out"] = r.timedOut;
    obj["metrics"] = MetricsReport::toJSON(r.metrics);
    return obj;
}

json BenchRunner::toJSON(const TimeoutScalingResult& r) {
    json obj = json::object();
    obj["waiters"] = r.waiters;
    obj["timeout_ms"] = r.timeout.count();
    obj["timed_out"] = r.timedOut;
    obj["avg_call_ms"] = r.avgCallMs;
    obj["avg_overshoot_ms"] = r.avgOvershootMs;
    obj["max_overshoot_ms"] = r.maxOvershootMs;
    obj["metrics"] = MetricsReport::toJSON(r.metrics);
    return obj;
}

std::string BenchRunner::toText(const ChurnResult& r) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    out << "Scenario: " << r.options.label << " (pool " << r.options.minSize << ".." << r.options.maxSize
        << ", " << r.options.threads << " threads x " << r.options.opsPerThread << " ops)\n";
    out << "  Total time: " << r.elapsedSec << "s\n";
    out << "  Throughput: " << std::setprecision(0) << r.throughput << " ops/sec\n";
    out << std::setprecision(3);
    out << "  Avg time per op: " << r.avgOpMs << "ms\n";
    out << "  Completed: " << r.completed << ", timed out: " << r.timedOut << "\n";

    uint64_t waits = r.metrics.spinWaits + r.metrics.parkWaits;
    out << "  Waits: " << r.metrics.totalWaits << " (spin " << r.metrics.spinWaits
        << ", park " << r.metrics.parkWaits << ")\n";
    if (waits > 0) {
        out << std::setprecision(1);
        out << "  Spin ratio: " << static_cast<double>(r.metrics.spinWaits) * 100.0 / static_cast<double>(waits)
            << "%\n";
    }
    return out.str();
}

std::string BenchRunner::toText(const TimeoutScalingResult& r) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    out << "Waiters: " << std::setw(4) << r.waiters
        << "  timed out: " << std::setw(4) << r.timedOut
        << "  avg call: " << r.avgCallMs << "ms"
        << "  avg overshoot: " << r.avgOvershootMs << "ms"
        << "  max overshoot: " << r.maxOvershootMs << "ms\n";
    return out.str();
}

}  // namespace sqlpool
