/**
 * @file ConnectionPool.cpp
 * @brief Implementation of the bounded connection pool.
 */

#include "ConnectionPool.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <optional>
#include <string>
#include <thread>

namespace sqlpool {

namespace {

using Clock = std::chrono::steady_clock;

// nullopt when the timeout reaches past the clock's range
std::optional<Clock::time_point> deadlineFor(Clock::time_point start,
                                             std::chrono::milliseconds timeout) {
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - start);
    if (timeout >= headroom) {
        return std::nullopt;
    }
    return start + timeout;
}

long long elapsedMs(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

// Records one waiting acquire when it leaves the contention phase,
// whether it got a connection or threw
class WaitRecorder {
public:
    WaitRecorder(PoolMetrics& metrics, Clock::time_point start)
        : m_metrics(metrics), m_start(start) {}
    ~WaitRecorder() { m_metrics.recordWait(m_parked, Clock::now() - m_start); }

    WaitRecorder(const WaitRecorder&) = delete;
    WaitRecorder& operator=(const WaitRecorder&) = delete;

    void markParked() { m_parked = true; }

private:
    PoolMetrics& m_metrics;
    Clock::time_point m_start;
    bool m_parked = false;
};

}  // namespace

// ============================================================================
// ScopedConnection
// ============================================================================

ScopedConnection::ScopedConnection(ConnectionPool& pool, std::shared_ptr<Connection> conn)
    : m_pool(&pool), m_conn(std::move(conn)) {
}

ScopedConnection::~ScopedConnection() {
    release();
}

ScopedConnection::ScopedConnection(ScopedConnection&& other) noexcept
    : m_pool(other.m_pool), m_conn(std::move(other.m_conn)) {
}

ScopedConnection& ScopedConnection::operator=(ScopedConnection&& other) noexcept {
    if (this != &other) {
        release();
        m_pool = other.m_pool;
        m_conn = std::move(other.m_conn);
    }
    return *this;
}

void ScopedConnection::release() {
    if (m_conn) {
        auto conn = std::move(m_conn);
        m_pool->release(conn);
    }
}

// ============================================================================
// Construction and Destruction
// ============================================================================

ConnectionPool::ConnectionPool(std::shared_ptr<Driver> driver,
                               ConnectionConfig connConfig,
                               PoolConfig config)
    : m_driver(std::move(driver))
    , m_connConfig(std::move(connConfig))
    , m_config(config) {

    m_config.validate();
    if (!m_driver) {
        throw ConfigError("Connection pool requires a driver");
    }

    // Pre-create min_size connections
    try {
        for (int64_t i = 0; i < m_config.min_size; ++i) {
            auto conn = openConnection();
            std::lock_guard<std::mutex> lock(m_mutex);
            makeSlot(std::move(conn), false);
        }
    } catch (const ConnectError& e) {
        spdlog::error("Failed to pre-create connection {} of {}: {}",
                      m_slots.size() + 1, m_config.min_size, e.what());
        m_closed.store(true, std::memory_order_release);
        for (const auto& slot : m_slots) {
            destroySlot(slot);
        }
        m_slots.clear();
        m_index.clear();
        throw;
    }

    spdlog::info("{} connection pool initialized with {} connections (max {})",
                 m_driver->name(), m_slots.size(), m_config.max_size);
}

ConnectionPool::~ConnectionPool() {
    close();
}

// ============================================================================
// Slot Lifecycle
// ============================================================================

std::unique_ptr<Connection> ConnectionPool::openConnection() {
    ErrorContext context("connect " + m_driver->name());

    std::unique_ptr<Connection> conn;
    try {
        conn = m_driver->connect(m_connConfig);
    } catch (const ConnectError& e) {
        m_metrics.recordConnectFailure();
        spdlog::error("[{}] {}", ErrorContext::current(), e.what());
        throw;
    } catch (const std::exception& e) {
        m_metrics.recordConnectFailure();
        spdlog::error("[{}] {}", ErrorContext::current(), e.what());
        throw ConnectError(m_driver->name() + " driver failed to connect: " + e.what());
    }

    if (!conn) {
        m_metrics.recordConnectFailure();
        throw ConnectError(m_driver->name() + " driver returned no connection");
    }
    return conn;
}

std::shared_ptr<ConnectionPool::Slot> ConnectionPool::makeSlot(std::unique_ptr<Connection> conn,
                                                               bool inUse) {
    auto slot = std::make_shared<Slot>();
    slot->id = m_nextSlotId++;
    slot->connection = std::shared_ptr<Connection>(std::move(conn));
    slot->inUse = inUse;
    slot->createdAt = Clock::now();
    slot->lastUsedAt = slot->createdAt;
    slot->lastValidatedAt = slot->createdAt;

    m_slots.push_back(slot);
    m_index.emplace(slot->connection.get(), slot);
    m_metrics.recordCreated();

    spdlog::debug("Created {} connection #{} (total: {})",
                  m_driver->name(), slot->id, m_slots.size());
    return slot;
}

void ConnectionPool::destroySlot(const std::shared_ptr<Slot>& slot) {
    try {
        slot->connection->close();
    } catch (const std::exception& e) {
        m_metrics.recordCloseFailure();
        spdlog::warn("Failed to close connection #{}: {}", slot->id, e.what());
    }
    m_metrics.recordDestroyed();
    spdlog::debug("Destroyed connection #{}", slot->id);
}

std::shared_ptr<Connection> ConnectionPool::growSlot(bool replacing) {
    std::unique_ptr<Connection> conn;
    try {
        conn = openConnection();
    } catch (const ConnectError&) {
        std::shared_ptr<Waiter> wake;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_reserved;
            if (!m_closed.load(std::memory_order_relaxed)) {
                wake = m_waitQueue.popLive();
            }
        }
        // The reservation is free again; let a parked caller try for it
        if (wake) {
            wake->notifier.notify(WakeReason::Released);
        }
        throw;
    }

    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_reserved;
        if (!m_closed.load(std::memory_order_relaxed)) {
            slot = makeSlot(std::move(conn), true);
            m_metrics.recordCheckout();
        }
    }

    if (!slot) {
        // Closed while connecting
        try {
            conn->close();
        } catch (const std::exception& e) {
            m_metrics.recordCloseFailure();
            spdlog::warn("Failed to close connection opened during close: {}", e.what());
        }
        throw PoolClosedError();
    }

    if (replacing) {
        m_metrics.recordReconnection();
        spdlog::info("Replaced unhealthy connection with #{}", slot->id);
    }
    return slot->connection;
}

// ============================================================================
// Fast Path
// ============================================================================

bool ConnectionPool::needsHealthCheck(const Slot& slot, Clock::time_point now) const {
    if (m_config.health_check_interval.count() == 0) {
        return false;
    }
    auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - slot.lastUsedAt);
    return idle >= m_config.health_check_interval;
}

std::shared_ptr<Connection> ConnectionPool::tryFastPath(std::shared_ptr<Waiter>* waiter) {
    bool replacing = false;

    while (true) {
        std::shared_ptr<Slot> candidate;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed.load(std::memory_order_relaxed)) {
                throw PoolClosedError();
            }

            auto now = Clock::now();
            auto it = std::find_if(m_slots.begin(), m_slots.end(),
                                   [](const std::shared_ptr<Slot>& slot) { return !slot->inUse; });

            if (it != m_slots.end()) {
                candidate = *it;
                candidate->inUse = true;
                if (!needsHealthCheck(*candidate, now)) {
                    candidate->lastUsedAt = now;
                    m_metrics.recordCheckout();
                    return candidate->connection;
                }
                // Fall through to validate outside the lock
            } else if (m_slots.size() + m_reserved < static_cast<size_t>(m_config.max_size)) {
                ++m_reserved;
            } else {
                if (waiter) {
                    *waiter = std::make_shared<Waiter>(m_nextSequence++);
                    m_waitQueue.push(*waiter);
                }
                return nullptr;
            }
        }

        if (!candidate) {
            return growSlot(replacing);
        }

        // The slot is marked in use, so nobody else touches it while we validate
        bool healthy = candidate->connection->validate();

        std::shared_ptr<Waiter> wake;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            bool closed = m_closed.load(std::memory_order_relaxed);

            if (healthy && !closed) {
                auto now = Clock::now();
                candidate->lastValidatedAt = now;
                candidate->lastUsedAt = now;
                m_metrics.recordCheckout();
                return candidate->connection;
            }

            // close() left this in-use slot in the index; drop it either way
            m_index.erase(candidate->connection.get());
            auto it = std::find(m_slots.begin(), m_slots.end(), candidate);
            if (it != m_slots.end()) {
                m_slots.erase(it);
            }
            if (!healthy && !closed) {
                wake = m_waitQueue.popLive();
            }
        }

        if (healthy) {
            // Pool closed during validation
            destroySlot(candidate);
            throw PoolClosedError();
        }

        m_metrics.recordHealthCheckFailure();
        spdlog::warn("Connection #{} failed health check, replacing", candidate->id);
        destroySlot(candidate);
        if (wake) {
            wake->notifier.notify(WakeReason::Released);
        }
        replacing = true;
    }
}

// ============================================================================
// Acquire and Release
// ============================================================================

std::shared_ptr<Connection> ConnectionPool::acquire() {
    return acquire(m_config.acquire_timeout);
}

std::shared_ptr<Connection> ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    m_metrics.recordAcquire();

    if (isClosed()) {
        throw PoolClosedError();
    }

    auto start = Clock::now();
    auto deadline = deadlineFor(start, timeout);

    if (auto conn = tryFastPath(nullptr)) {
        return conn;
    }

    WaitRecorder recorder(m_metrics, start);

    auto timedOut = [&]() {
        m_metrics.recordTimeout();
        auto snapshot = m_metrics.snapshot();
        auto waited = elapsedMs(start);
        spdlog::debug("Acquire timed out after {}ms", waited);
        return TimeoutError("Connection acquisition timeout after " + std::to_string(waited) +
                            "ms (pool exhausted: " + std::to_string(snapshot.currentUsage) + "/" +
                            std::to_string(m_config.max_size) + " connections in use)");
    };

    // Spin phase: retry without suspending, a racing release often lands here
    for (int64_t i = 0; i < m_config.spin_iterations; ++i) {
        if (deadline && Clock::now() >= *deadline) {
            throw timedOut();
        }
        std::this_thread::yield();
        if (auto conn = tryFastPath(nullptr)) {
            return conn;
        }
    }

    // Park phase
    while (true) {
        std::shared_ptr<Waiter> waiter;
        if (auto conn = tryFastPath(&waiter)) {
            return conn;
        }
        recorder.markParked();

        WakeReason reason = waiter->notifier.wait(deadline);
        if (reason == WakeReason::Released) {
            // Only a hint: a spinning caller may already have taken the slot
            continue;
        }
        if (reason == WakeReason::Closed) {
            throw PoolClosedError();
        }

        if (waiter->tryClaim()) {
            throw timedOut();
        }

        // A release or close claimed this waiter as the deadline passed.
        // Hand the wake-up on so it is not lost.
        std::shared_ptr<Waiter> next;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed.load(std::memory_order_relaxed)) {
                throw PoolClosedError();
            }
            next = m_waitQueue.popLive();
        }
        if (next) {
            next->notifier.notify(WakeReason::Released);
        }
        throw timedOut();
    }
}

void ConnectionPool::release(const std::shared_ptr<Connection>& conn) {
    if (!conn) {
        m_metrics.recordReleaseWarning();
        spdlog::warn("Attempting to release a null connection");
        return;
    }

    enum class Outcome { Pooled, Detached, Foreign, NotInUse, AfterClose };

    Outcome outcome = Outcome::Pooled;
    std::shared_ptr<Slot> slot;
    std::shared_ptr<Waiter> waiter;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        bool closed = m_closed.load(std::memory_order_relaxed);

        auto it = m_index.find(conn.get());
        if (it == m_index.end()) {
            outcome = closed ? Outcome::AfterClose : Outcome::Foreign;
        } else if (!it->second->inUse) {
            outcome = Outcome::NotInUse;
            slot = it->second;
        } else if (closed) {
            outcome = Outcome::Detached;
            slot = it->second;
            m_index.erase(it);
        } else {
            slot = it->second;
            slot->inUse = false;
            slot->lastUsedAt = Clock::now();
            waiter = m_waitQueue.popLive();
        }
    }

    switch (outcome) {
        case Outcome::Pooled:
            m_metrics.recordRelease();
            m_metrics.recordCheckin();
            if (waiter) {
                waiter->notifier.notify(WakeReason::Released);
            }
            break;
        case Outcome::Detached:
            m_metrics.recordRelease();
            m_metrics.recordCheckin();
            spdlog::debug("Pool closed, closing released connection #{}", slot->id);
            destroySlot(slot);
            break;
        case Outcome::AfterClose:
            spdlog::debug("Ignoring release of unknown connection after close");
            break;
        case Outcome::Foreign:
            m_metrics.recordReleaseWarning();
            spdlog::warn("Attempting to release {} connection not in pool", conn->backend());
            break;
        case Outcome::NotInUse:
            m_metrics.recordReleaseWarning();
            spdlog::warn("Releasing connection #{} that is not marked as in use", slot->id);
            break;
    }
}

// ============================================================================
// Close
// ============================================================================

void ConnectionPool::close() {
    std::vector<std::shared_ptr<Slot>> idle;
    std::vector<std::shared_ptr<Waiter>> waiters;
    size_t busy = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed.load(std::memory_order_relaxed)) {
            return;
        }
        m_closed.store(true, std::memory_order_release);

        for (auto& slot : m_slots) {
            if (slot->inUse) {
                ++busy;
                continue;
            }
            m_index.erase(slot->connection.get());
            idle.push_back(std::move(slot));
        }
        m_slots.clear();
        waiters = m_waitQueue.drain();
    }

    for (const auto& waiter : waiters) {
        waiter->notifier.notify(WakeReason::Closed);
    }
    for (const auto& slot : idle) {
        destroySlot(slot);
    }

    spdlog::info("{} connection pool closed ({} closed, {} waiters woken, {} still checked out)",
                 m_driver->name(), idle.size(), waiters.size(), busy);
}

// ============================================================================
// Pool Statistics
// ============================================================================

size_t ConnectionPool::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

size_t ConnectionPool::inUseCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_slots.begin(), m_slots.end(),
                                             [](const std::shared_ptr<Slot>& slot) { return slot->inUse; }));
}

size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_slots.begin(), m_slots.end(),
                                             [](const std::shared_ptr<Slot>& slot) { return !slot->inUse; }));
}

size_t ConnectionPool::waitingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waitQueue.liveCount();
}

}  // namespace sqlpool
