#pragma once

#include <stdexcept>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Exception types thrown across component boundaries.
//
// @details
// Four classes of failure exist in a run:
//
//   1. Transient      → TimeoutError, ProviderError, CircuitOpenError.
//                       Raised around DecisionProvider calls, absorbed by
//                       the DecisionOrchestrator (degraded opinion).
//   2. Validation     → MalformedOutput. Provider payload did not match the
//                       role's schema. Absorbed by the orchestrator.
//   3. Business rule  → NOT an exception. PositionManager reports these
//                       through TransactionStatus (InsufficientFunds,
//                       InsufficientPosition).
//   4. Configuration  → InvalidConfiguration. The only error that escapes
//                       SimulationEngine::run(); thrown before any portfolio
//                       state is touched.
//
// All types derive from BacktestError so a caller that only cares about
// "something in the engine failed" can catch one type.
// -----------------------------------------------------------------------------
class BacktestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class InvalidConfiguration : public BacktestError {
 public:
  using BacktestError::BacktestError;
};

// A single provider attempt, or the whole call, exceeded its deadline.
class TimeoutError : public BacktestError {
 public:
  using BacktestError::BacktestError;
};

// Provider content could not be parsed into the role's typed payload.
class MalformedOutput : public BacktestError {
 public:
  using BacktestError::BacktestError;
};

// Generic provider failure (network, remote error, ...). Retried.
class ProviderError : public BacktestError {
 public:
  using BacktestError::BacktestError;
};

// Raised without calling the provider while a channel's circuit is OPEN, or
// while its single HALF_OPEN trial call is in flight.
class CircuitOpenError : public BacktestError {
 public:
  explicit CircuitOpenError(const std::string& channel)
      : BacktestError("circuit open for channel '" + channel + "'"),
        channel_(channel) {}

  const std::string& channel() const { return channel_; }

 private:
  std::string channel_;
};

}  // namespace backtest
