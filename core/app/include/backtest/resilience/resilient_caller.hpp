#pragma once

#include "backtest/agents/i_decision_provider.hpp"
#include "backtest/config/backtest_config.hpp"
#include "backtest/resilience/circuit_breaker.hpp"
#include "backtest/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace backtest {

// Per-channel view for STATUS replies and tests.
struct ChannelStatus {
  std::string channel;
  std::string state;
  int consecutive_failures{0};
  std::uint64_t rejected_calls{0};
};

// -----------------------------------------------------------------------------
// ResilientCaller: retry, backoff, hard timeout and circuit breaking around
// an IDecisionProvider
// -----------------------------------------------------------------------------
//
// @brief  call(role, context) either returns the provider's response or
//         throws one of CircuitOpenError, TimeoutError, MalformedOutput,
//         ProviderError.
//
// @details
// Each role is its own channel with its own CircuitBreaker.
//
// Per call:
//   1. Ask the channel's breaker; if it refuses, throw CircuitOpenError
//      without touching the provider.
//   2. Run the provider on a detached thread and wait at most
//      min(call_timeout_ms, remaining deadline). An unfinished attempt
//      counts as a timeout; its thread is abandoned and its result dropped.
//      A provider that never returns keeps its thread forever, so at most
//      max_in_flight_attempts provider calls (running or abandoned) exist
//      at once; an attempt beyond that is not started and fails with
//      ProviderError like any other attempt.
//   3. Success → breaker success, return.
//      MalformedOutput → breaker success (the channel answered), rethrow;
//      retrying would reproduce the same payload.
//      Timeout / any other std::exception → breaker failure, then retry after
//      min(base_delay_ms * 2^attempt, max_delay_ms) while attempts remain
//      and the delay still fits in the call deadline.
//   4. When the deadline is exhausted after a timeout, throw TimeoutError;
//      when attempts run out, throw the last error (TimeoutError for a
//      timeout, ProviderError otherwise).
//
// The deadline is accounted as measured attempt time plus requested backoff,
// so a test that injects a no-op sleeper sees the same decisions as a real
// run.
//
// Thread model:
//   call() is safe from many threads at once; the breaker map is guarded by
//   its own mutex and each breaker locks internally.
//
// Ownership:
//   Shares ownership of the provider with abandoned attempt threads, so a
//   provider that outlives its timeout never touches freed memory. Holds a
//   non-owning reference to the time provider used for breaker cooldowns.
// -----------------------------------------------------------------------------
class ResilientCaller {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ResilientCaller(std::shared_ptr<IDecisionProvider> provider,
                  const ITimeProvider& clock, RetryConfig config,
                  Sleeper sleeper = {});

  ResilientCaller(const ResilientCaller&) = delete;
  ResilientCaller& operator=(const ResilientCaller&) = delete;

  ProviderResponse call(domain::AgentRole role, const nlohmann::json& context);

  ChannelStatus status(domain::AgentRole role);
  std::vector<ChannelStatus> statuses() const;

  // Number of times the provider was actually invoked, across all channels.
  std::uint64_t providerInvocations() const { return invocations_.load(); }

  // Provider calls still running, abandoned ones included.
  int attemptsInFlight() const { return in_flight_->load(); }

  // Backoff before retry number `attempt` (0-based).
  std::chrono::milliseconds backoffDelay(int attempt) const;

 private:
  CircuitBreaker& breakerFor(const std::string& channel);
  ProviderResponse invokeWithTimeout(domain::AgentRole role,
                                     const nlohmann::json& context,
                                     std::chrono::milliseconds timeout);

  std::shared_ptr<IDecisionProvider> provider_;
  const ITimeProvider& clock_;
  RetryConfig config_;
  Sleeper sleeper_;

  mutable std::mutex breakers_mutex_;
  std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
  std::atomic<std::uint64_t> invocations_{0};
  std::shared_ptr<std::atomic<int>> in_flight_ =
      std::make_shared<std::atomic<int>>(0);
};

}  // namespace backtest
