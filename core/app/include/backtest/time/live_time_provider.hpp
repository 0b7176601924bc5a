#pragma once

#include "backtest/time/i_time_provider.hpp"

namespace backtest {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns std::chrono::system_clock time in epoch milliseconds.
//
// @details
// Used by the resilience layer in a real run: cache TTLs and circuit
// cooldowns are about how long the external DecisionProvider has been
// failing in real time, not about simulated trading days.
//
// Thread model: stateless, safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace backtest
