// =============================================================================
// cancellation_token_test.cpp
// =============================================================================
// Unit tests for tradeloop::CancellationSource / CancellationToken.
// =============================================================================

#include "tradeloop/concurrent/cancellation_token.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace tradeloop;

// -----------------------------------------------------------------------------
// 1. cancel() is visible through every token copy.
// -----------------------------------------------------------------------------
TEST(CancellationTokenTest, CancelIsSharedByAllTokens) {
  CancellationSource source;
  CancellationToken a = source.token();
  CancellationToken b = a;

  EXPECT_FALSE(a.isCancelled());
  source.cancel();
  EXPECT_TRUE(a.isCancelled());
  EXPECT_TRUE(b.isCancelled());
  EXPECT_TRUE(source.isCancelled());
}

// -----------------------------------------------------------------------------
// 2. waitFor() times out with false when nobody cancels.
// -----------------------------------------------------------------------------
TEST(CancellationTokenTest, WaitForTimesOutWhenNotCancelled) {
  CancellationSource source;
  EXPECT_FALSE(source.token().waitFor(std::chrono::milliseconds(10)));
}

// -----------------------------------------------------------------------------
// 3. cancel() wakes a waiter long before its deadline.
// -----------------------------------------------------------------------------
TEST(CancellationTokenTest, CancelWakesWaiter) {
  CancellationSource source;
  std::atomic<bool> result{false};

  std::thread waiter([&result, token = source.token()] {
    result.store(token.waitFor(std::chrono::hours(1)));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  source.cancel();
  waiter.join();

  EXPECT_TRUE(result.load());
}

// -----------------------------------------------------------------------------
// 4. A default token never cancels; a fresh source starts clean.
// Why: The orchestrator makes a new source per run; a stale cancel from
//      the previous run must not leak into the next.
// -----------------------------------------------------------------------------
TEST(CancellationTokenTest, DefaultTokenAndFreshSource) {
  CancellationToken never;
  EXPECT_FALSE(never.isCancelled());
  EXPECT_FALSE(never.waitFor(std::chrono::milliseconds(1)));

  CancellationSource first;
  first.cancel();
  CancellationSource second;
  EXPECT_FALSE(second.token().isCancelled());
}
