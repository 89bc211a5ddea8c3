#include <gtest/gtest.h>
#include "WaitQueue.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace sqlpool;
using namespace std::chrono_literals;

// Notifier tests
class NotifierTest : public ::testing::Test {
};

TEST_F(NotifierTest, FirstNotifyWins) {
    Notifier notifier;

    EXPECT_FALSE(notifier.fired());
    EXPECT_TRUE(notifier.notify(WakeReason::Released));
    EXPECT_FALSE(notifier.notify(WakeReason::Closed));
    EXPECT_TRUE(notifier.fired());

    EXPECT_EQ(notifier.wait(std::nullopt), WakeReason::Released);
}

TEST_F(NotifierTest, WaitTimesOutWithNone) {
    Notifier notifier;

    auto start = std::chrono::steady_clock::now();
    auto reason = notifier.wait(start + 20ms);

    EXPECT_EQ(reason, WakeReason::None);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST_F(NotifierTest, NotifyBeforeWaitIsNotLost) {
    Notifier notifier;
    notifier.notify(WakeReason::Closed);

    EXPECT_EQ(notifier.wait(std::chrono::steady_clock::now() + 1s), WakeReason::Closed);
}

TEST_F(NotifierTest, WakesBlockedThread) {
    Notifier notifier;
    std::atomic<WakeReason> observed{WakeReason::None};

    std::thread waiter([&]() {
        observed = notifier.wait(std::chrono::steady_clock::now() + 5s);
    });

    std::this_thread::sleep_for(20ms);
    notifier.notify(WakeReason::Released);
    waiter.join();

    EXPECT_EQ(observed.load(), WakeReason::Released);
}

// Waiter tests
TEST(WaiterTest, ExactlyOneClaimSucceeds) {
    auto waiter = std::make_shared<Waiter>(7);
    std::atomic<int> winners{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (waiter->tryClaim()) {
                winners.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_TRUE(waiter->isCancelled());
    EXPECT_EQ(waiter->sequence, 7u);
}

// WaitQueue tests
class WaitQueueTest : public ::testing::Test {
protected:
    std::shared_ptr<Waiter> pushNew() {
        auto waiter = std::make_shared<Waiter>(nextSeq_++);
        queue_.push(waiter);
        return waiter;
    }

    WaitQueue queue_;
    uint64_t nextSeq_ = 0;
};

TEST_F(WaitQueueTest, EmptyQueue) {
    EXPECT_TRUE(queue_.empty());
    EXPECT_EQ(queue_.liveCount(), 0u);
    EXPECT_EQ(queue_.popLive(), nullptr);
    EXPECT_TRUE(queue_.drain().empty());
}

TEST_F(WaitQueueTest, PopLiveIsFifo) {
    auto a = pushNew();
    auto b = pushNew();
    auto c = pushNew();

    EXPECT_EQ(queue_.popLive(), a);
    EXPECT_EQ(queue_.popLive(), b);
    EXPECT_EQ(queue_.popLive(), c);
    EXPECT_EQ(queue_.popLive(), nullptr);
}

TEST_F(WaitQueueTest, PopLiveClaimsWaiter) {
    auto a = pushNew();

    auto popped = queue_.popLive();

    ASSERT_EQ(popped, a);
    EXPECT_TRUE(a->isCancelled());
    EXPECT_FALSE(a->tryClaim());
}

TEST_F(WaitQueueTest, PopLiveSkipsCancelled) {
    auto a = pushNew();
    auto b = pushNew();
    auto c = pushNew();

    // A and B time out: they retire themselves without touching the queue
    ASSERT_TRUE(a->tryClaim());
    ASSERT_TRUE(b->tryClaim());
    EXPECT_EQ(queue_.size(), 3u);
    EXPECT_EQ(queue_.liveCount(), 1u);

    EXPECT_EQ(queue_.popLive(), c);
    EXPECT_EQ(queue_.skipped(), 2u);
    EXPECT_TRUE(queue_.empty());
}

TEST_F(WaitQueueTest, AllCancelledYieldsNull) {
    auto a = pushNew();
    auto b = pushNew();
    a->tryClaim();
    b->tryClaim();

    EXPECT_EQ(queue_.popLive(), nullptr);
    EXPECT_TRUE(queue_.empty());
    EXPECT_EQ(queue_.skipped(), 2u);
}

TEST_F(WaitQueueTest, PushPrunesCancelledFront) {
    for (int i = 0; i < 100; ++i) {
        auto waiter = pushNew();
        waiter->tryClaim();
    }

    // Each push drops the retired entry ahead of it
    EXPECT_EQ(queue_.size(), 1u);
    EXPECT_EQ(queue_.liveCount(), 0u);
    EXPECT_EQ(queue_.skipped(), 99u);
}

TEST_F(WaitQueueTest, PushKeepsLiveFront) {
    auto a = pushNew();
    auto b = pushNew();
    b->tryClaim();
    auto c = pushNew();

    // Only the front is pruned; B stays until it reaches the front
    EXPECT_EQ(queue_.size(), 3u);
    EXPECT_EQ(queue_.popLive(), a);
    EXPECT_EQ(queue_.popLive(), c);
}

TEST_F(WaitQueueTest, DrainClaimsOnlyLiveWaiters) {
    auto a = pushNew();
    auto b = pushNew();
    auto c = pushNew();
    b->tryClaim();

    auto drained = queue_.drain();

    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0], a);
    EXPECT_EQ(drained[1], c);
    EXPECT_TRUE(a->isCancelled());
    EXPECT_TRUE(c->isCancelled());
    EXPECT_TRUE(queue_.empty());
    EXPECT_EQ(queue_.skipped(), 1u);
}

TEST_F(WaitQueueTest, CancelRacingWithPopHasOneWinner) {
    for (int round = 0; round < 200; ++round) {
        WaitQueue queue;
        auto waiter = std::make_shared<Waiter>(static_cast<uint64_t>(round));
        queue.push(waiter);

        std::atomic<bool> timeoutWon{false};
        std::shared_ptr<Waiter> popped;

        std::thread timeout([&]() { timeoutWon = waiter->tryClaim(); });
        popped = queue.popLive();
        timeout.join();

        // Exactly one side retired the waiter
        EXPECT_NE(timeoutWon.load(), popped != nullptr);
    }
}
