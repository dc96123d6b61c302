#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace rxpos {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between threads. In rxpos it carries
// telemetry events from whichever thread completed a sale (main thread or
// the IPC command handler) to the IPC server's publishing loop, so that JSON
// formatting and socket I/O never run inside a sale commit.
//
// Thread model: Safe for multiple producers and multiple consumers.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // Appends one item and wakes one blocked pop().
  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // -------------------------------------------------------------------------
  // pop(): blocking
  // -------------------------------------------------------------------------
  // Removes and returns the front item, waiting until one is available.
  // The predicate form of wait() re-checks after spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Removes and returns the front item, or std::nullopt if the queue is
  // empty. Never blocks.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change it immediately.
  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace rxpos
