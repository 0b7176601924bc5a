#pragma once

#include <atomic>
#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// SequenceGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique ids for TradingDecisions and Transactions.
//
// @details
// Starts at 1; 0 is reserved as the "unset" sentinel in Transaction::id.
// fetch_add with relaxed ordering is enough because the only requirement is
// uniqueness; no other memory operation is ordered against the counter.
//
// Decision cycles for different symbols may run concurrently on the
// engine's WorkerPool, so next_id() must be safe from any thread.
//
// Ownership:
//   SimulationEngine owns one generator for decisions and PositionManager
//   owns one for transactions. Both outlive every component that borrows
//   them. reset() is only called between runs.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  // -------------------------------------------------------------------------
  // next_id()
  // -------------------------------------------------------------------------
  // @return A value unique across all calls on this instance.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Restarts numbering at 1. Not safe against concurrent next_id().
  void reset() { next_id_.store(1, std::memory_order_relaxed); }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace backtest
