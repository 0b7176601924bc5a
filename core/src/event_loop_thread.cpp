#include "backtest/concurrent/event_loop_thread.hpp"

#include <chrono>

namespace backtest {

namespace {

constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

// -----------------------------------------------------------------------------
// stop(): wake the worker, join it, then deliver anything pushed late
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();

  // Events pushed between the worker's last pop and the join are delivered
  // on the stopping thread; nothing is running concurrently any more.
  drain();
}

void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = queue_.try_pop()) {
      bus_.publish(*event);
      ++delivered_;
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
  drain();
}

void EventLoopThread::drain() {
  while (auto event = queue_.try_pop()) {
    bus_.publish(*event);
    ++delivered_;
  }
}

}  // namespace backtest
