#pragma once

/**
 * @file WaitQueue.hpp
 * @brief Parked acquirers of a ConnectionPool and their wake handles.
 *
 * A Waiter is shared between the WaitQueue (for ordered wake-up) and the
 * thread parked on it (to time out). Either side retires it by winning the
 * compare-and-set on Waiter::cancelled, so cancelling never has to search
 * the queue. Retired entries are dropped lazily when they reach the front.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace sqlpool {

enum class WakeReason {
    None,      ///< Not fired (wait timed out)
    Released,  ///< Capacity became available; retry the fast path
    Closed     ///< Pool closed; give up
};

/**
 * @class Notifier
 * @brief Single-use wake handle for one parked thread.
 *
 * The first notify() wins and later calls are ignored, so a waiter that is
 * claimed by a release and by close at the same time observes one reason.
 */
class Notifier {
public:
    Notifier() = default;

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;

    /**
     * @brief Fire the handle.
     * @return false if it had already fired.
     */
    bool notify(WakeReason reason);

    /**
     * @brief Block until fired or until the deadline passes.
     * @param deadline nullopt waits without a time limit.
     * @return The reason passed to notify(), or WakeReason::None on timeout.
     */
    WakeReason wait(std::optional<std::chrono::steady_clock::time_point> deadline);

    bool fired() const;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    WakeReason m_reason = WakeReason::None;
};

struct Waiter {
    explicit Waiter(uint64_t seq)
        : sequence(seq), enqueuedAt(std::chrono::steady_clock::now()) {}

    Waiter(const Waiter&) = delete;
    Waiter& operator=(const Waiter&) = delete;

    // Flip cancelled false -> true. Exactly one caller ever gets true.
    bool tryClaim() noexcept {
        bool expected = false;
        return cancelled.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

    bool isCancelled() const noexcept {
        return cancelled.load(std::memory_order_acquire);
    }

    const uint64_t sequence;                              ///< Registration order
    std::atomic<bool> cancelled{false};                   ///< Retired (woken, timed out or closed)
    Notifier notifier;                                    ///< Wakes the parked thread
    const std::chrono::steady_clock::time_point enqueuedAt;
};

/**
 * @class WaitQueue
 * @brief FIFO of waiters ordered by sequence with lazy removal.
 *
 * Not synchronized: the owning pool serializes every call under its mutex.
 * Notifying the returned waiters is left to the caller so that it can
 * happen after the pool mutex is released.
 */
class WaitQueue {
public:
    WaitQueue() = default;

    WaitQueue(const WaitQueue&) = delete;
    WaitQueue& operator=(const WaitQueue&) = delete;

    /**
     * @brief Append a waiter. Sequences must be pushed in increasing order.
     *
     * Retired entries at the front are dropped first so that a queue fed
     * only by timeouts does not grow without bound.
     */
    void push(std::shared_ptr<Waiter> waiter);

    /**
     * @brief Pop from the front until a waiter is claimed.
     * @return The claimed waiter (cancelled is now true), or nullptr if no
     *         live waiter remains.
     *
     * Each entry is popped at most once over its lifetime.
     */
    std::shared_ptr<Waiter> popLive();

    /**
     * @brief Empty the queue, claiming every live waiter.
     * @return Waiters this call claimed, in sequence order.
     */
    std::vector<std::shared_ptr<Waiter>> drain();

    // Physical entries, retired ones included
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    // Entries not yet retired; walks the queue
    size_t liveCount() const;

    // Retired entries dropped without a wake-up so far
    uint64_t skipped() const { return m_skipped; }

private:
    void pruneFront();

    std::deque<std::shared_ptr<Waiter>> m_entries;
    uint64_t m_skipped = 0;
};

}  // namespace sqlpool
