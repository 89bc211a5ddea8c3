#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace sqlpool {

/// @brief Contention counters of one ConnectionPool
///
/// Every field is an atomic updated with relaxed ordering, so taking a
/// snapshot never blocks and is never blocked by acquire()/release().
/// Fields of one snapshot may be read at slightly different instants.
class PoolMetrics {
public:
    struct Snapshot {
        uint64_t totalAcquires = 0;        ///< acquire() calls
        uint64_t totalReleases = 0;        ///< Accepted release() calls
        uint64_t totalWaits = 0;           ///< Acquires that missed the fast path
        uint64_t spinWaits = 0;            ///< ...and were satisfied while spinning
        uint64_t parkWaits = 0;            ///< ...and had to park at least once
        uint64_t totalTimeouts = 0;        ///< TimeoutError raised
        double avgWaitTimeMs = 0.0;        ///< Mean wait of the waiting acquires
        double waitPercentage = 0.0;       ///< totalWaits / totalAcquires * 100
        uint64_t healthCheckFailures = 0;  ///< Idle slots that failed validate()
        uint64_t reconnections = 0;        ///< Replacements after a failed check
        uint64_t connectionsCreated = 0;
        uint64_t connectionsDestroyed = 0;
        uint64_t connectFailures = 0;
        uint64_t closeFailures = 0;        ///< Connection::close() threw
        uint64_t releaseWarnings = 0;      ///< Double or foreign release
        uint64_t peakUsage = 0;            ///< Most connections in use at once
        uint64_t currentUsage = 0;
        uint64_t poolSize = 0;
    };

    PoolMetrics() = default;

    PoolMetrics(const PoolMetrics&) = delete;
    PoolMetrics& operator=(const PoolMetrics&) = delete;

    void recordAcquire() { m_totalAcquires.fetch_add(1, std::memory_order_relaxed); }
    void recordRelease() { m_totalReleases.fetch_add(1, std::memory_order_relaxed); }
    void recordTimeout() { m_totalTimeouts.fetch_add(1, std::memory_order_relaxed); }

    // One call per waiting acquire, made when it leaves the wait
    void recordWait(bool parked, std::chrono::steady_clock::duration waited);

    void recordHealthCheckFailure() { m_healthCheckFailures.fetch_add(1, std::memory_order_relaxed); }
    void recordReconnection() { m_reconnections.fetch_add(1, std::memory_order_relaxed); }
    void recordConnectFailure() { m_connectFailures.fetch_add(1, std::memory_order_relaxed); }
    void recordCloseFailure() { m_closeFailures.fetch_add(1, std::memory_order_relaxed); }
    void recordReleaseWarning() { m_releaseWarnings.fetch_add(1, std::memory_order_relaxed); }

    void recordCreated();
    void recordDestroyed();

    // Gauge updates; checkout also maintains the peak
    void recordCheckout();
    void recordCheckin() { m_currentUsage.fetch_sub(1, std::memory_order_relaxed); }

    Snapshot snapshot() const;

private:
    std::atomic<uint64_t> m_totalAcquires{0};
    std::atomic<uint64_t> m_totalReleases{0};
    std::atomic<uint64_t> m_totalWaits{0};
    std::atomic<uint64_t> m_spinWaits{0};
    std::atomic<uint64_t> m_parkWaits{0};
    std::atomic<uint64_t> m_totalTimeouts{0};
    std::atomic<uint64_t> m_totalWaitMicros{0};

    std::atomic<uint64_t> m_healthCheckFailures{0};
    std::atomic<uint64_t> m_reconnections{0};
    std::atomic<uint64_t> m_connectionsCreated{0};
    std::atomic<uint64_t> m_connectionsDestroyed{0};
    std::atomic<uint64_t> m_connectFailures{0};
    std::atomic<uint64_t> m_closeFailures{0};
    std::atomic<uint64_t> m_releaseWarnings{0};

    // Gauges
    std::atomic<uint64_t> m_peakUsage{0};
    std::atomic<uint64_t> m_currentUsage{0};
    std::atomic<uint64_t> m_poolSize{0};
};

}  // namespace sqlpool
