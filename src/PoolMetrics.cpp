#include "PoolMetrics.hpp"

namespace sqlpool {

void PoolMetrics::recordWait(bool parked, std::chrono::steady_clock::duration waited) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(waited).count();

    m_totalWaits.fetch_add(1, std::memory_order_relaxed);
    if (parked) {
        m_parkWaits.fetch_add(1, std::memory_order_relaxed);
    } else {
        m_spinWaits.fetch_add(1, std::memory_order_relaxed);
    }
    m_totalWaitMicros.fetch_add(micros > 0 ? static_cast<uint64_t>(micros) : 0,
                                std::memory_order_relaxed);
}

void PoolMetrics::recordCreated() {
    m_connectionsCreated.fetch_add(1, std::memory_order_relaxed);
    m_poolSize.fetch_add(1, std::memory_order_relaxed);
}

void PoolMetrics::recordDestroyed() {
    m_connectionsDestroyed.fetch_add(1, std::memory_order_relaxed);
    m_poolSize.fetch_sub(1, std::memory_order_relaxed);
}

void PoolMetrics::recordCheckout() {
    uint64_t usage = m_currentUsage.fetch_add(1, std::memory_order_relaxed) + 1;

    uint64_t peak = m_peakUsage.load(std::memory_order_relaxed);
    while (usage > peak &&
           !m_peakUsage.compare_exchange_weak(peak, usage, std::memory_order_relaxed)) {
    }
}

PoolMetrics::Snapshot PoolMetrics::snapshot() const {
    Snapshot s{
        .totalAcquires = m_totalAcquires.load(std::memory_order_relaxed),
        .totalReleases = m_totalReleases.load(std::memory_order_relaxed),
        .totalWaits = m_totalWaits.load(std::memory_order_relaxed),
        .spinWaits = m_spinWaits.load(std::memory_order_relaxed),
        .parkWaits = m_parkWaits.load(std::memory_order_relaxed),
        .totalTimeouts = m_totalTimeouts.load(std::memory_order_relaxed),
        .healthCheckFailures = m_healthCheckFailures.load(std::memory_order_relaxed),
        .reconnections = m_reconnections.load(std::memory_order_relaxed),
        .connectionsCreated = m_connectionsCreated.load(std::memory_order_relaxed),
        .connectionsDestroyed = m_connectionsDestroyed.load(std::memory_order_relaxed),
        .connectFailures = m_connectFailures.load(std::memory_order_relaxed),
        .closeFailures = m_closeFailures.load(std::memory_order_relaxed),
        .releaseWarnings = m_releaseWarnings.load(std::memory_order_relaxed),
        .peakUsage = m_peakUsage.load(std::memory_order_relaxed),
        .currentUsage = m_currentUsage.load(std::memory_order_relaxed),
        .poolSize = m_poolSize.load(std::memory_order_relaxed),
    };

    uint64_t waitMicros = m_totalWaitMicros.load(std::memory_order_relaxed);
    if (s.totalWaits > 0) {
        s.avgWaitTimeMs = static_cast<double>(waitMicros) / 1000.0 / static_cast<double>(s.totalWaits);
    }
    if (s.totalAcquires > 0) {
        s.waitPercentage = static_cast<double>(s.totalWaits) * 100.0 / static_cast<double>(s.totalAcquires);
    }
    return s;
}

}  // namespace sqlpool
