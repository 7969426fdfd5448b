// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for tradeloop::ThreadSafeQueue<T>, the hand-off between the
// decision thread (pushTelemetry) and the IPC worker (try_pop drain).
// =============================================================================

#include "tradeloop/concurrent/thread_safe_queue.hpp"
#include "tradeloop/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <thread>
#include <variant>
#include <vector>

using namespace tradeloop;

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Items come out in push order; try_pop on empty gives nullopt.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrderAndEmptyTryPop) {
  EXPECT_FALSE(queue.try_pop().has_value());

  queue.push(1);
  queue.push(2);
  queue.push(3);

  EXPECT_EQ(queue.try_pop().value(), 1);
  EXPECT_EQ(queue.try_pop().value(), 2);
  EXPECT_EQ(queue.try_pop().value(), 3);
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 2. Event variants move through the queue intact.
// Why: The IPC server queues Event by value; the alternative must survive.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueEventTest, CarriesEventVariants) {
  ThreadSafeQueue<Event> events;

  PositionUpdateEvent update;
  update.position.instrument = "ETHUSDT";
  update.position.quantity = 0.002;
  events.push(update);

  auto popped = events.try_pop();
  ASSERT_TRUE(popped.has_value());
  const auto* as_update = std::get_if<PositionUpdateEvent>(&*popped);
  ASSERT_NE(as_update, nullptr);
  EXPECT_EQ(as_update->position.instrument, "ETHUSDT");
  EXPECT_DOUBLE_EQ(as_update->position.quantity, 0.002);
}

// -----------------------------------------------------------------------------
// 3. Several producers, one draining consumer: nothing lost or duplicated.
// Why: Mirrors the IPC worker draining telemetry pushed from other threads.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersSingleDrainer) {
  constexpr int kProducers = 4;
  constexpr int kItemsPerProducer = 500;
  constexpr int kTotal = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      for (int i = 0; i < kItemsPerProducer; ++i) {
        queue.push(p * kItemsPerProducer + i);
      }
    });
  }

  std::vector<int> drained;
  while (static_cast<int>(drained.size()) < kTotal) {
    while (auto item = queue.try_pop()) {
      drained.push_back(*item);
    }
    std::this_thread::yield();
  }
  for (auto& t : producers) t.join();

  std::sort(drained.begin(), drained.end());
  ASSERT_EQ(static_cast<int>(drained.size()), kTotal);
  for (int i = 0; i < kTotal; ++i) {
    EXPECT_EQ(drained[i], i);
  }
}
