#pragma once

#include "backtest/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock for backtesting
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is set explicitly by the calendar loop.
//
// @details
// SimulationEngine calls advance_time(date_ms) at the top of every trading
// date before any decision cycle runs, so every timestamp produced while
// processing that date (decision, transaction, audit record) carries the
// simulated date. Identical inputs therefore yield identical outputs.
//
// Tests also use it as a controllable clock for ResultCache TTL and
// CircuitBreaker cooldown.
//
// Storage is a std::atomic<int64_t>: one writer (the calendar loop or a
// test), many readers (decision cycles on worker threads). Lock-free on
// 64-bit targets.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  // Last value written by advance_time()/advance_by(); 0 before the first.
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // Sets the clock. Monotonicity is the caller's responsibility; tests rely
  // on being able to set arbitrary values.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms (test convenience).
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace backtest
