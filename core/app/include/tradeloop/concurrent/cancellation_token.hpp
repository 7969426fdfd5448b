#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace tradeloop {

namespace detail {

// Shared state between one CancellationSource and all tokens it hands out.
struct CancellationState {
  std::mutex mutex;
  std::condition_variable cv;
  bool cancelled{false};
};

}  // namespace detail

// -----------------------------------------------------------------------------
// CancellationToken — read side of a cooperative cancellation signal
// -----------------------------------------------------------------------------
//
// @brief  Cheap, copyable handle that long-running tasks poll at the top of
//         every loop iteration and use for their inter-cycle sleep.
//
// @details
// Tasks never get interrupted mid-call. They call isCancelled() at the loop
// top and waitFor(interval) instead of std::this_thread::sleep_for(), so a
// cancel request wakes a sleeping task immediately. An in-flight venue call
// still runs to completion; shutdown latency is bounded by that call.
//
// A default-constructed token is never cancelled and waitFor() simply sleeps
// for the full duration. Useful for running a collector by hand in tests.
//
// Thread model:
//   All methods are safe to call from any thread. Copies share state.
// -----------------------------------------------------------------------------
class CancellationToken {
 public:
  CancellationToken() = default;

  bool isCancelled() const {
    if (!state_) {
      return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

  // -------------------------------------------------------------------------
  // waitFor(duration)
  // -------------------------------------------------------------------------
  // @brief  Blocks for up to `duration`, returning early if cancelled.
  //
  // @return true if the token is cancelled when the wait ends.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  bool waitFor(std::chrono::duration<Rep, Period> duration) const {
    if (!state_) {
      std::this_thread::sleep_for(duration);
      return false;
    }
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_for(lock, duration,
                               [this] { return state_->cancelled; });
  }

 private:
  friend class CancellationSource;

  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

// -----------------------------------------------------------------------------
// CancellationSource — write side of the cancellation signal
// -----------------------------------------------------------------------------
//
// @brief  Owned by whoever controls a run (TradingOrchestrator). cancel()
//         flips the shared flag and wakes every waiter.
//
// @details
// Cancellation is one-way: once cancelled, a source stays cancelled. The
// orchestrator creates a fresh source for every start(), so a stopped
// orchestrator can be started again.
// -----------------------------------------------------------------------------
class CancellationSource {
 public:
  CancellationSource()
      : state_(std::make_shared<detail::CancellationState>()) {}

  CancellationToken token() const { return CancellationToken(state_); }

  void cancel() {
    {
      std::lock_guard lock(state_->mutex);
      state_->cancelled = true;
    }
    state_->cv.notify_all();
  }

  bool isCancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
  }

 private:
  std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace tradeloop
