#pragma once

/**
 * @file BenchRunner.hpp
 * @brief Contention scenarios for measuring ConnectionPool behaviour.
 *
 * Every scenario builds its own pool from the runner's driver and
 * connection settings, drives it from plain std::threads and returns the
 * pool's metrics alongside wall-clock figures.
 */

#include "ConnectionPool.hpp"
#include "MetricsReport.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace sqlpool {

struct ChurnOptions {
    std::string label;
    int64_t minSize = 2;
    int64_t maxSize = 2;
    int threads = 10;
    int opsPerThread = 100;
    std::chrono::microseconds hold{1000};       // Time a connection is kept per operation
    std::chrono::milliseconds timeout{30000};   // Per-acquire timeout
};

struct ChurnResult {
    ChurnOptions options;
    double elapsedSec = 0.0;
    double throughput = 0.0;     // Completed operations per second
    double avgOpMs = 0.0;        // Wall time per attempted operation
    uint64_t completed = 0;
    uint64_t timedOut = 0;
    PoolMetrics::Snapshot metrics;
};

struct TimeoutScalingResult {
    int waiters = 0;
    std::chrono::milliseconds timeout{0};
    uint64_t timedOut = 0;
    double avgCallMs = 0.0;      // Mean duration of one timed-out acquire
    double avgOvershootMs = 0.0; // Mean duration past the requested timeout
    double maxOvershootMs = 0.0;
    PoolMetrics::Snapshot metrics;
};

class BenchRunner {
public:
    /**
     * @param base Pool settings shared by every scenario. Sizes and the
     *        acquire timeout are overridden per scenario.
     */
    BenchRunner(std::shared_ptr<Driver> driver, ConnectionConfig connConfig, PoolConfig base = PoolConfig{});

    /**
     * @brief Many threads acquire, hold and release against a small pool.
     *
     * TimeoutError is counted, any other exception propagates.
     */
    ChurnResult runChurn(const ChurnOptions& options);

    /**
     * @brief Park @p waiters threads on an exhausted single-connection pool
     *        and measure how long each takes to time out.
     *
     * With O(1) cancellation the overshoot stays flat as waiters grow.
     */
    TimeoutScalingResult runTimeoutScaling(int waiters, std::chrono::milliseconds timeout);

    // Scenario sets
    static std::vector<ChurnOptions> churnScenarios();
    static std::vector<ChurnOptions> spinParkScenarios();
    static std::vector<int> timeoutScalingWaiters() { return {10, 50, 100, 200}; }

    static json toJSON(const ChurnResult& result);
    static json toJSON(const TimeoutScalingResult& result);
    static std::string toText(const ChurnResult& result);
    static std::string toText(const TimeoutScalingResult& result);

private:
    std::shared_ptr<Driver> m_driver;
    ConnectionConfig m_connConfig;
    PoolConfig m_base;
};

}  // namespace sqlpool
