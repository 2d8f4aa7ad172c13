// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for credit::ThreadSafeQueue<T>, instantiated with rendered
// telemetry strings.
//
// Validates:
//   - FIFO order of telemetry messages
//   - try_pop() never blocks
//   - pop() wakes when a producer pushes
//   - No loss or duplication with several producers and one drain thread
// =============================================================================

#include "credit/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  credit::ThreadSafeQueue<std::string> queue;
};

TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);
}

// -----------------------------------------------------------------------------
// 1. Messages leave in the order they were pushed.
// Why: Subscribers rebuild loan state from the telemetry stream; an opened
//      event arriving after its repaid event would be unreadable.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  for (int i = 0; i < 50; ++i) {
    queue.push("msg-" + std::to_string(i));
  }
  EXPECT_EQ(queue.size(), 50u);
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(queue.pop(), "msg-" + std::to_string(i));
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. try_pop() returns nullopt on empty and the front element otherwise.
// Why: The server loop polls with try_pop() between command timeouts and
//      must never stall there.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push("loan_opened");
  std::optional<std::string> front = queue.try_pop();
  ASSERT_TRUE(front.has_value());
  EXPECT_EQ(*front, "loan_opened");
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. pop() blocks until a value is available.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<bool> done{false};
  std::string received;

  std::thread consumer([this, &done, &received] {
    received = queue.pop();
    done.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(done.load());

  queue.push("ledger_paused");
  consumer.join();

  EXPECT_TRUE(done.load());
  EXPECT_EQ(received, "ledger_paused");
}

// -----------------------------------------------------------------------------
// 4. Several publishing threads, one draining thread.
// Why: Bus callbacks may run on any thread that commits a ledger call while
//      the IPC thread drains; every message must arrive exactly once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ManyProducersOneConsumer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;
  constexpr int kTotal = kProducers * kPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        queue.push(std::to_string(p) + ":" + std::to_string(i));
      }
    });
  }

  std::set<std::string> seen;
  int duplicates = 0;
  std::thread consumer([this, &seen, &duplicates] {
    for (int n = 0; n < kTotal; ++n) {
      if (!seen.insert(queue.pop()).second) {
        ++duplicates;
      }
    }
  });

  for (auto& t : producers) t.join();
  consumer.join();

  EXPECT_EQ(duplicates, 0);
  EXPECT_EQ(static_cast<int>(seen.size()), kTotal);
  EXPECT_TRUE(queue.empty());
}
