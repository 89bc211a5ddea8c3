#include "WaitQueue.hpp"

namespace sqlpool {

// ============================================================================
// Notifier
// ============================================================================

bool Notifier::notify(WakeReason reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_reason != WakeReason::None) {
            return false;
        }
        m_reason = reason;
    }
    m_cv.notify_one();
    return true;
}

WakeReason Notifier::wait(std::optional<std::chrono::steady_clock::time_point> deadline) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto fired = [this] { return m_reason != WakeReason::None; };

    if (!deadline) {
        m_cv.wait(lock, fired);
    } else {
        m_cv.wait_until(lock, *deadline, fired);
    }
    return m_reason;
}

bool Notifier::fired() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reason != WakeReason::None;
}

// ============================================================================
// WaitQueue
// ============================================================================

void WaitQueue::push(std::shared_ptr<Waiter> waiter) {
    pruneFront();
    m_entries.push_back(std::move(waiter));
}

std::shared_ptr<Waiter> WaitQueue::popLive() {
    while (!m_entries.empty()) {
        auto waiter = std::move(m_entries.front());
        m_entries.pop_front();

        if (waiter->tryClaim()) {
            return waiter;
        }
        ++m_skipped;
    }
    return nullptr;
}

std::vector<std::shared_ptr<Waiter>> WaitQueue::drain() {
    std::vector<std::shared_ptr<Waiter>> claimed;
    claimed.reserve(m_entries.size());

    for (auto& waiter : m_entries) {
        if (waiter->tryClaim()) {
            claimed.push_back(std::move(waiter));
        } else {
            ++m_skipped;
        }
    }
    m_entries.clear();
    return claimed;
}

size_t WaitQueue::liveCount() const {
    size_t live = 0;
    for (const auto& waiter : m_entries) {
        if (!waiter->isCancelled()) {
            ++live;
        }
    }
    return live;
}

void WaitQueue::pruneFront() {
    while (!m_entries.empty() && m_entries.front()->isCancelled()) {
        m_entries.pop_front();
        ++m_skipped;
    }
}

}  // namespace sqlpool
