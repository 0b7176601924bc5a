#pragma once

#include "backtest/concurrent/thread_safe_queue.hpp"
#include "backtest/eventbus/event_bus.hpp"
#include "backtest/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace backtest {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread that drains a ThreadSafeQueue<Event> and
//         re-publishes each event on its own EventBus.
//
// @details
// SimulationEngine pushes every event from its internal bus into this loop,
// so external subscribers (telemetry bridge, CLI progress output, tests)
// run on the loop thread and can never stall a decision cycle.
//
// stop() delivers whatever is still queued before the worker exits; a
// subscriber that registered before the run finished sees every event of
// the run.
//
// Thread model:
//   push() and eventBus() are safe from any thread. Subscriber callbacks run
//   only on the loop thread. start()/stop() are idempotent.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  EventLoopThread() = default;
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();
  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  std::size_t delivered() const { return delivered_.load(); }

 private:
  void run();
  void drain();

  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> delivered_{0};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace backtest
