#include "backtest/concurrent/worker_pool.hpp"

#include <iostream>

namespace backtest {

// -----------------------------------------------------------------------------
// Constructor: spawn workers
// -----------------------------------------------------------------------------
WorkerPool::WorkerPool(std::size_t threads, std::string name)
    : name_(std::move(name)) {
  if (threads == 0) {
    threads = 1;
  }
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { run(); });
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII shutdown
// -----------------------------------------------------------------------------
WorkerPool::~WorkerPool() { shutdown(); }

// -----------------------------------------------------------------------------
// shutdown(): one poison pill per worker, then join
// -----------------------------------------------------------------------------
void WorkerPool::shutdown() {
  if (stopped_) {
    return;
  }
  stopped_ = true;

  // Pills go to the back of the queue, so every task submitted earlier is
  // popped (and run) before any worker sees its pill.
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    tasks_.push(Task{});
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void WorkerPool::run() {
  while (true) {
    Task task = tasks_.pop();
    if (!task) {
      return;
    }
    // packaged_task captures exceptions into the future; anything escaping
    // here came from outside a submit() wrapper and would terminate the
    // process, so report it before rethrowing.
    try {
      task();
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] ERROR: task escaped with exception: "
                << e.what() << "\n";
      throw;
    }
  }
}

}  // namespace backtest
