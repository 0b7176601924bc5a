#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace backtest {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T>
// -----------------------------------------------------------------------------
// Responsibility: Unbounded FIFO shared between threads. Carries tasks into
// the WorkerPool, events into an EventLoopThread and telemetry into the
// IpcServer.
//
// Thread model: Multiple producers, multiple consumers. Every method locks
// mutex_; pop() and pop_for() wait on condition_ until an item arrives.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  // mutex_ and condition_ are neither copyable nor movable; share the queue
  // by reference.
  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  // -------------------------------------------------------------------------
  // push(value)
  // -------------------------------------------------------------------------
  // Appends to the back and wakes one waiting consumer. The notify happens
  // after the lock is released so the woken thread does not immediately
  // contend for it.
  // -------------------------------------------------------------------------
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
  // Waits until an item is available and moves it out. The predicate form
  // of wait() absorbs spurious wakeups.
  // -------------------------------------------------------------------------
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout): blocking with an upper bound
  // -------------------------------------------------------------------------
  // @return The front item, or std::nullopt if nothing arrived within
  //         timeout. Lets a consumer loop re-check a stop flag.
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Non-blocking: front item or std::nullopt.
  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // Snapshot only; another thread may change the answer immediately after.
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

}  // namespace backtest
