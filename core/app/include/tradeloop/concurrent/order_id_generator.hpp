#pragma once

#include "tradeloop/domain/order.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace tradeloop {

// -----------------------------------------------------------------------------
// OrderIdGenerator — thread-safe source of process-unique order ids
// -----------------------------------------------------------------------------
//
// @brief  Produces ids of the form "<session>-<n>", where <session> is fixed
//         for the generator's lifetime and <n> is an atomically incremented
//         counter starting at 1.
//
// @details
// The default session prefix is the construction time in epoch milliseconds,
// so ids from two runs of the process do not collide in venue logs. Tests
// pass an explicit prefix to get predictable ids.
//
// Uniqueness only relies on fetch_add; std::memory_order_relaxed is enough
// because no other memory operation is ordered against the counter.
//
// Thread model:
//   next_id() is safe to call concurrently from any thread.
//
// Ownership:
//   Owned by TradingOrchestrator as a value member and never shared.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator()
      : session_(std::to_string(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count())) {}

  explicit OrderIdGenerator(std::string session)
      : session_(std::move(session)) {}

  // Non-copyable, non-movable: a copy would hand out duplicate ids.
  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @brief  Returns the next unique order id.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  Atomically increments the internal counter.
  // -------------------------------------------------------------------------
  domain::OrderId next_id() {
    std::uint64_t n = next_.fetch_add(1, std::memory_order_relaxed);
    return session_ + "-" + std::to_string(n);
  }

  const std::string& session() const { return session_; }

 private:
  const std::string session_;
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace tradeloop
