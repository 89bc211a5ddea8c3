#pragma once

/**
 * @file ConnectionPool.hpp
 * @brief Bounded, thread-safe pool of reusable database connections.
 *
 * The pool hands out connections from any Driver. Acquisition first scans
 * for an idle slot (the fast path), then spins for a bounded number of
 * retries, and finally parks the caller on a private Notifier registered in
 * a WaitQueue. Every release wakes at most one parked caller.
 */

#include "Config.hpp"
#include "Driver.hpp"
#include "PoolMetrics.hpp"
#include "WaitQueue.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sqlpool {

class ConnectionPool;

/**
 * @class ScopedConnection
 * @brief RAII lease that returns its connection to the pool when destroyed.
 *
 * Usage:
 * @code
 *   {
 *       auto conn = pool.lease();
 *       conn->execute("DELETE FROM sessions WHERE expired = 1");
 *   }  // Connection automatically returned to pool here
 * @endcode
 */
class ScopedConnection {
public:
    ScopedConnection(ConnectionPool& pool, std::shared_ptr<Connection> conn);
    ~ScopedConnection();

    // Non-copyable to prevent double-release
    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    // Movable for transfer of ownership
    ScopedConnection(ScopedConnection&& other) noexcept;
    ScopedConnection& operator=(ScopedConnection&& other) noexcept;

    Connection& operator*() const { return *m_conn; }
    Connection* operator->() const { return m_conn.get(); }
    Connection* get() const { return m_conn.get(); }
    explicit operator bool() const { return m_conn != nullptr; }

    /**
     * @brief Return the connection early. Further calls do nothing.
     */
    void release();

private:
    ConnectionPool* m_pool;             ///< Owning pool
    std::shared_ptr<Connection> m_conn; ///< Null once released
};

/**
 * @class ConnectionPool
 * @brief Admission control for a bounded set of connections.
 *
 * Key features:
 * - min_size connections opened eagerly, more grown lazily up to max_size
 * - connect() and validate() never run under the pool mutex; growth is
 *   accounted for by a reservation taken before the connect call
 * - Idle connections older than health_check_interval are validated before
 *   being handed out and transparently replaced when they fail
 * - Timed-out waiters retire themselves in O(1) through their cancelled flag
 * - Lock-free metrics snapshots
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - A checked-out Connection belongs to its holder until release()
 *
 * Ordering between waiters is approximately FIFO. A caller still in its spin
 * phase can take a freed connection ahead of an older parked waiter.
 */
class ConnectionPool {
public:
    /**
     * @brief Create the pool and open min_size connections.
     * @param driver Backend used to open connections.
     * @param connConfig Passed unchanged to every Driver::connect() call.
     * @param config Pool bounds and timing.
     * @throws ConfigError if config is invalid or driver is null.
     * @throws ConnectError if one of the initial connections fails; the ones
     *         already opened are closed again.
     */
    ConnectionPool(std::shared_ptr<Driver> driver, ConnectionConfig connConfig, PoolConfig config);

    /**
     * @brief Destructor - closes the pool.
     */
    ~ConnectionPool();

    // Non-copyable, non-movable
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief Acquire a connection using PoolConfig::acquire_timeout.
     */
    std::shared_ptr<Connection> acquire();

    /**
     * @brief Acquire a connection, blocking for at most timeout.
     * @param timeout milliseconds::max() waits without limit.
     * @return A connection checked out to the caller, never null.
     * @throws TimeoutError if the deadline passes first.
     * @throws PoolClosedError if the pool is or becomes closed.
     * @throws ConnectError if this call had to open a connection and failed.
     */
    std::shared_ptr<Connection> acquire(std::chrono::milliseconds timeout);

    /**
     * @brief Return a connection obtained from acquire().
     *
     * Releasing a connection twice, or one the pool does not know, logs a
     * warning and is otherwise ignored. After close() the connection is
     * closed instead of being pooled.
     */
    void release(const std::shared_ptr<Connection>& conn);

    ScopedConnection lease() { return ScopedConnection(*this, acquire()); }
    ScopedConnection lease(std::chrono::milliseconds timeout) {
        return ScopedConnection(*this, acquire(timeout));
    }

    /**
     * @brief Run f(Connection&) on a pooled connection.
     * @return Whatever f returns.
     *
     * The connection is released on every exit path, including when f throws.
     */
    template <typename F>
    auto withConnection(F&& f) -> decltype(f(std::declval<Connection&>())) {
        return withConnection(m_config.acquire_timeout, std::forward<F>(f));
    }

    template <typename F>
    auto withConnection(std::chrono::milliseconds timeout, F&& f)
        -> decltype(f(std::declval<Connection&>())) {
        ScopedConnection conn(*this, acquire(timeout));
        return std::forward<F>(f)(*conn);
    }

    /**
     * @brief Close the pool. Idempotent.
     *
     * Idle connections are closed, every parked caller is woken with
     * PoolClosedError, and later acquire() calls fail immediately.
     * Connections still checked out are closed when they are released.
     */
    void close();

    PoolMetrics::Snapshot getMetrics() const { return m_metrics.snapshot(); }

    // Pool statistics
    size_t size() const;
    size_t inUseCount() const;
    size_t idleCount() const;
    size_t waitingCount() const;
    bool isClosed() const { return m_closed.load(std::memory_order_acquire); }

    const PoolConfig& config() const { return m_config; }

private:
    using Clock = std::chrono::steady_clock;

    struct Slot {
        uint64_t id = 0;
        std::shared_ptr<Connection> connection;
        bool inUse = false;
        Clock::time_point createdAt;
        Clock::time_point lastUsedAt;       ///< Last checkout or release
        Clock::time_point lastValidatedAt;
    };

    /**
     * @brief One fast-path attempt: idle slot, else growth.
     * @param waiter If non-null and the pool is exhausted, a Waiter is
     *        registered under the same lock that observed the exhaustion.
     * @return A checked-out connection, or nullptr if none is available.
     */
    std::shared_ptr<Connection> tryFastPath(std::shared_ptr<Waiter>* waiter);

    /**
     * @brief Open a connection against a reservation already taken.
     * @param replacing True when the new slot replaces one that failed its
     *        health check.
     * @throws ConnectError after giving the reservation back and waking
     *         one waiter.
     */
    std::shared_ptr<Connection> growSlot(bool replacing);

    // Driver::connect() with non-ConnectError failures converted
    std::unique_ptr<Connection> openConnection();

    // Caller holds m_mutex
    std::shared_ptr<Slot> makeSlot(std::unique_ptr<Connection> conn, bool inUse);

    // Close a slot's connection; never throws
    void destroySlot(const std::shared_ptr<Slot>& slot);

    bool needsHealthCheck(const Slot& slot, Clock::time_point now) const;

    std::shared_ptr<Driver> m_driver;   ///< Backend
    ConnectionConfig m_connConfig;      ///< Connection parameters
    PoolConfig m_config;                ///< Bounds and timing

    std::vector<std::shared_ptr<Slot>> m_slots;                      ///< At most max_size
    std::unordered_map<Connection*, std::shared_ptr<Slot>> m_index;  ///< Connection -> slot
    size_t m_reserved = 0;              ///< Growth in progress outside the lock
    uint64_t m_nextSlotId = 1;
    uint64_t m_nextSequence = 0;        ///< Waiter registration order
    WaitQueue m_waitQueue;

    mutable std::mutex m_mutex;         ///< Protects everything above
    std::atomic<bool> m_closed{false};  ///< Written under m_mutex
    PoolMetrics m_metrics;
};

}  // namespace sqlpool
