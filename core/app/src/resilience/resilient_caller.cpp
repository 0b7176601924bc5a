#include "backtest/resilience/resilient_caller.hpp"

#include "backtest/error/errors.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <thread>
#include <utility>

namespace backtest {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start);
}

}  // namespace

ResilientCaller::ResilientCaller(std::shared_ptr<IDecisionProvider> provider,
                                 const ITimeProvider& clock,
                                 RetryConfig config, Sleeper sleeper)
    : provider_(std::move(provider)),
      clock_(clock),
      config_(config),
      sleeper_(std::move(sleeper)) {
  if (!provider_) {
    throw InvalidConfiguration("ResilientCaller requires a decision provider");
  }
  if (config_.max_attempts < 1 || config_.failure_threshold < 1 ||
      config_.max_in_flight_attempts < 1) {
    throw InvalidConfiguration(
        "ResilientCaller requires max_attempts, failure_threshold and "
        "max_in_flight_attempts >= 1");
  }
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

std::chrono::milliseconds ResilientCaller::backoffDelay(int attempt) const {
  std::int64_t delay = config_.base_delay_ms;
  for (int i = 0; i < attempt && delay < config_.max_delay_ms; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, config_.max_delay_ms));
}

// -----------------------------------------------------------------------------
// call(): breaker gate → timed attempt → classify → backoff
// -----------------------------------------------------------------------------
ProviderResponse ResilientCaller::call(domain::AgentRole role,
                                       const nlohmann::json& context) {
  const std::string channel = domain::to_string(role);
  CircuitBreaker& breaker = breakerFor(channel);

  const std::chrono::milliseconds deadline(config_.call_deadline_ms);
  const std::chrono::milliseconds per_attempt(config_.call_timeout_ms);
  std::chrono::milliseconds spent{0};
  bool last_was_timeout = false;
  std::string last_error;

  for (int attempt = 0; attempt < config_.max_attempts; ++attempt) {
    if (!breaker.acquire()) {
      throw CircuitOpenError(channel);
    }

    const auto remaining = deadline - spent;
    const auto timeout = std::min(per_attempt, remaining);
    const auto started = Clock::now();

    try {
      ProviderResponse response = invokeWithTimeout(role, context, timeout);
      breaker.recordSuccess();
      return response;
    } catch (const MalformedOutput&) {
      breaker.recordSuccess();
      throw;
    } catch (const TimeoutError& e) {
      breaker.recordFailure();
      last_was_timeout = true;
      last_error = e.what();
    } catch (const std::exception& e) {
      breaker.recordFailure();
      last_was_timeout = false;
      last_error = e.what();
    }

    spent += elapsed_since(started);
    std::cerr << "[ResilientCaller] WARNING: " << channel << " attempt "
              << (attempt + 1) << "/" << config_.max_attempts
              << " failed: " << last_error << "\n";

    if (attempt + 1 >= config_.max_attempts) {
      break;
    }

    const auto delay = backoffDelay(attempt);
    if (spent + delay >= deadline) {
      throw TimeoutError("call deadline of " +
                         std::to_string(config_.call_deadline_ms) +
                         " ms exceeded on channel '" + channel +
                         "': " + last_error);
    }
    sleeper_(delay);
    spent += delay;
  }

  if (last_was_timeout) {
    throw TimeoutError("retries exhausted on channel '" + channel +
                       "': " + last_error);
  }
  throw ProviderError("retries exhausted on channel '" + channel +
                      "': " + last_error);
}

// -----------------------------------------------------------------------------
// invokeWithTimeout(): provider on a detached thread, bounded wait
// -----------------------------------------------------------------------------
ProviderResponse ResilientCaller::invokeWithTimeout(
    domain::AgentRole role, const nlohmann::json& context,
    std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    throw TimeoutError("no time left for an attempt");
  }

  if (in_flight_->fetch_add(1) >= config_.max_in_flight_attempts) {
    in_flight_->fetch_sub(1);
    throw ProviderError(std::to_string(config_.max_in_flight_attempts) +
                        " provider calls still running, attempt not started");
  }

  auto promise = std::make_shared<std::promise<ProviderResponse>>();
  std::future<ProviderResponse> result = promise->get_future();

  ++invocations_;
  std::thread([provider = provider_, promise, role, context,
               in_flight = in_flight_]() {
    std::optional<ProviderResponse> response;
    std::exception_ptr error;
    try {
      response = provider->generate(role, context);
    } catch (...) {
      error = std::current_exception();
    }
    // Released before the result is published.
    in_flight->fetch_sub(1);
    if (response) {
      promise->set_value(std::move(*response));
    } else {
      promise->set_exception(error);
    }
  }).detach();

  if (result.wait_for(timeout) == std::future_status::timeout) {
    throw TimeoutError("attempt exceeded " + std::to_string(timeout.count()) +
                       " ms");
  }
  return result.get();
}

CircuitBreaker& ResilientCaller::breakerFor(const std::string& channel) {
  std::lock_guard lock(breakers_mutex_);
  auto& slot = breakers_[channel];
  if (!slot) {
    slot = std::make_unique<CircuitBreaker>(channel, clock_,
                                            config_.failure_threshold,
                                            config_.cooldown_ms);
  }
  return *slot;
}

ChannelStatus ResilientCaller::status(domain::AgentRole role) {
  CircuitBreaker& breaker = breakerFor(domain::to_string(role));
  return ChannelStatus{breaker.channel(), breaker.stateName(),
                       breaker.consecutiveFailures(), breaker.rejectedCalls()};
}

std::vector<ChannelStatus> ResilientCaller::statuses() const {
  std::lock_guard lock(breakers_mutex_);
  std::vector<ChannelStatus> out;
  out.reserve(breakers_.size());
  for (const auto& [channel, breaker] : breakers_) {
    out.push_back(ChannelStatus{channel, breaker->stateName(),
                                breaker->consecutiveFailures(),
                                breaker->rejectedCalls()});
  }
  return out;
}

}  // namespace backtest
