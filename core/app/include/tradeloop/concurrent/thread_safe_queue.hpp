#pragma once

#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tradeloop {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO handed across a thread boundary. Producers
// push from any thread; the consumer drains with try_pop() so it can keep
// polling other work (the IPC server alternates between draining telemetry
// and polling its command socket).
//
// Thread model: All methods are thread-safe. Nothing blocks beyond the
// internal mutex.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(value));
  }

  // Non-blocking pop. std::nullopt when the queue is empty.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

 private:
  std::mutex mutex_;
  std::deque<T> queue_;
};

}  // namespace tradeloop
