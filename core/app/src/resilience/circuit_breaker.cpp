#include "backtest/resilience/circuit_breaker.hpp"

#include <iostream>
#include <utility>

namespace backtest {

CircuitBreaker::CircuitBreaker(std::string channel, const ITimeProvider& clock,
                               int failure_threshold, std::int64_t cooldown_ms)
    : channel_(std::move(channel)),
      clock_(clock),
      failure_threshold_(failure_threshold),
      cooldown_ms_(cooldown_ms) {}

// -----------------------------------------------------------------------------
// acquire(): CLOSED passes, OPEN fails until cooldown ends, HALF_OPEN admits
// one trial
// -----------------------------------------------------------------------------
bool CircuitBreaker::acquire() {
  std::lock_guard lock(mutex_);

  if (std::holds_alternative<Closed>(state_)) {
    return true;
  }

  if (const auto* open = std::get_if<Open>(&state_)) {
    if (clock_.now_ms() < open->until_ms) {
      ++rejected_;
      return false;
    }
    state_ = HalfOpen{};
    trial_in_flight_ = true;
    std::cout << "[CircuitBreaker] " << channel_
              << " cooldown elapsed, HALF_OPEN trial admitted\n";
    return true;
  }

  // HalfOpen
  if (trial_in_flight_) {
    ++rejected_;
    return false;
  }
  trial_in_flight_ = true;
  return true;
}

void CircuitBreaker::recordSuccess() {
  std::lock_guard lock(mutex_);
  if (!std::holds_alternative<Closed>(state_)) {
    std::cout << "[CircuitBreaker] " << channel_ << " trial succeeded, CLOSED\n";
  }
  state_ = Closed{};
  consecutive_failures_ = 0;
  trial_in_flight_ = false;
}

void CircuitBreaker::recordFailure() {
  std::lock_guard lock(mutex_);
  ++consecutive_failures_;
  const std::int64_t now = clock_.now_ms();

  if (std::holds_alternative<HalfOpen>(state_)) {
    trial_in_flight_ = false;
    openLocked(now);
    return;
  }
  if (std::holds_alternative<Closed>(state_) &&
      consecutive_failures_ >= failure_threshold_) {
    openLocked(now);
  }
}

void CircuitBreaker::openLocked(std::int64_t now) {
  state_ = Open{now + cooldown_ms_};
  std::cerr << "[CircuitBreaker] WARNING: " << channel_ << " OPEN after "
            << consecutive_failures_ << " consecutive failure(s), cooldown "
            << cooldown_ms_ << " ms\n";
}

CircuitBreaker::State CircuitBreaker::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

const char* CircuitBreaker::stateName() const {
  std::lock_guard lock(mutex_);
  if (std::holds_alternative<Closed>(state_)) {
    return "CLOSED";
  }
  if (std::holds_alternative<Open>(state_)) {
    return "OPEN";
  }
  return "HALF_OPEN";
}

int CircuitBreaker::consecutiveFailures() const {
  std::lock_guard lock(mutex_);
  return consecutive_failures_;
}

std::uint64_t CircuitBreaker::rejectedCalls() const {
  std::lock_guard lock(mutex_);
  return rejected_;
}

}  // namespace backtest
