#pragma once

#include <cstdint>

namespace backtest {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "current time" away from std::chrono::system_clock.
//
// @details
// Two kinds of component read the clock:
//
//   - SimulationEngine stamps decisions, transactions and portfolio
//     snapshots. It must see the simulated trading date, never wall-clock
//     time, or a replay would not be reproducible.
//   - ResultCache (TTL) and CircuitBreaker (cooldown) measure elapsed time.
//     In production they run on LiveTimeProvider; tests inject a
//     SimulationTimeProvider and advance it explicitly, which makes expiry
//     and OPEN → HALF_OPEN transitions deterministic.
//
// Components take `const ITimeProvider&` and never own it.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @return Milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace backtest
