#pragma once

#include "backtest/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <variant>

namespace backtest {

// -----------------------------------------------------------------------------
// CircuitBreaker: per-channel CLOSED / OPEN(until) / HALF_OPEN state
// -----------------------------------------------------------------------------
//
// @brief  Counts consecutive failures on one logical channel and refuses
//         calls for a cooldown once the threshold is reached.
//
// @details
// Transitions:
//   CLOSED    --failure #threshold-->  OPEN(now + cooldown)
//   OPEN      --acquire after until--> HALF_OPEN (that caller is the trial)
//   HALF_OPEN --success-->             CLOSED, counter reset
//   HALF_OPEN --failure-->             OPEN(now + cooldown)
//
// While HALF_OPEN exactly one trial is outstanding; every other acquire()
// fails until the trial reports back.
//
// Thread model:
//   All methods are safe from any thread. The ResilientCaller holds one
//   breaker per channel, so contention is limited to calls on the same role.
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  struct Closed {};
  struct Open {
    std::int64_t until_ms{0};
  };
  struct HalfOpen {};
  using State = std::variant<Closed, Open, HalfOpen>;

  CircuitBreaker(std::string channel, const ITimeProvider& clock,
                 int failure_threshold, std::int64_t cooldown_ms);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  // True when the caller may invoke the provider now.
  bool acquire();

  void recordSuccess();
  void recordFailure();

  State state() const;
  const char* stateName() const;
  int consecutiveFailures() const;
  std::uint64_t rejectedCalls() const;
  const std::string& channel() const { return channel_; }

 private:
  void openLocked(std::int64_t now);

  const std::string channel_;
  const ITimeProvider& clock_;
  const int failure_threshold_;
  const std::int64_t cooldown_ms_;

  mutable std::mutex mutex_;
  State state_{Closed{}};
  int consecutive_failures_{0};
  bool trial_in_flight_{false};
  std::uint64_t rejected_{0};
};

}  // namespace backtest
