#pragma once

#include "backtest/concurrent/thread_safe_queue.hpp"

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// WorkerPool
// -----------------------------------------------------------------------------
//
// @brief  Fixed set of worker threads draining one ThreadSafeQueue of tasks.
//
// @details
// Two places fan work out:
//
//   1. DecisionOrchestrator phases 2 and 4 submit one task per sub-opinion
//      (four analysts, then three risk stances) and fan back in by waiting
//      on the returned futures with a phase deadline.
//   2. SimulationEngine, when symbol_concurrency > 1, submits one decision
//      cycle per symbol for the current date.
//
// The pool is sized once at construction so concurrency is bounded; a
// submit() beyond the thread count simply queues.
//
// Shutdown uses one empty task per worker as a poison pill. Every task
// queued before shutdown() still runs, so no future handed out by submit()
// is left without a value or a broken_promise.
//
// Thread model:
//   submit() is safe from any thread, including from inside a task of a
//   DIFFERENT pool. A task must never block on a future of its own pool
//   (with every worker blocked the inner task would never be scheduled).
//
// Ownership:
//   Owns its threads. The destructor calls shutdown() and joins.
// -----------------------------------------------------------------------------
class WorkerPool {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  threads  Number of worker threads. Values below 1 are raised
  //                  to 1.
  // @param  name     Used only in log lines.
  //
  // Side-effects: Spawns the worker threads immediately.
  // -------------------------------------------------------------------------
  explicit WorkerPool(std::size_t threads, std::string name = "WorkerPool");

  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  // -------------------------------------------------------------------------
  // submit(fn)
  // -------------------------------------------------------------------------
  // @brief  Queues fn for execution on a worker.
  //
  // @return std::future for fn's result. An exception thrown by fn is
  //         stored in the future and rethrown by get().
  //
  // @details
  // std::packaged_task is move-only while std::function requires a copyable
  // target, so the task is held by shared_ptr and the queued closure just
  // invokes it.
  // -------------------------------------------------------------------------
  template <typename F>
  auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;
    auto task =
        std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    std::future<Result> future = task->get_future();
    tasks_.push([task] { (*task)(); });
    return future;
  }

  // -------------------------------------------------------------------------
  // shutdown()
  // -------------------------------------------------------------------------
  // Lets queued tasks finish, then joins every worker. Idempotent.
  // Must not be called from one of this pool's own workers.
  // -------------------------------------------------------------------------
  void shutdown();

  std::size_t threadCount() const { return workers_.size(); }

 private:
  using Task = std::function<void()>;

  void run();

  std::string name_;
  ThreadSafeQueue<Task> tasks_;
  std::vector<std::thread> workers_;
  bool stopped_{false};
};

}  // namespace backtest
