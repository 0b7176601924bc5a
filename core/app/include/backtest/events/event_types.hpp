#pragma once

#include "backtest/domain/backtest_result.hpp"
#include "backtest/domain/portfolio_state.hpp"
#include "backtest/domain/trading_decision.hpp"
#include "backtest/domain/transaction.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// DecisionEvent
// -----------------------------------------------------------------------------
// Published by DecisionOrchestrator when a decision cycle finishes, whatever
// its outcome. Carries the full decision so telemetry consumers can show the
// stance and confidence without querying the engine.
// -----------------------------------------------------------------------------
struct DecisionEvent {
  domain::TradingDecision decision;
  domain::ExecutionOutcome outcome{domain::ExecutionOutcome::Hold};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// TransactionEvent
// -----------------------------------------------------------------------------
// Published by PositionManager after a transaction has committed. Never
// published for a rejected transaction.
// -----------------------------------------------------------------------------
struct TransactionEvent {
  domain::Transaction transaction;
  double cash_after{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PortfolioUpdateEvent
// -----------------------------------------------------------------------------
// Published by PositionManager once per recorded daily snapshot.
// -----------------------------------------------------------------------------
struct PortfolioUpdateEvent {
  domain::PortfolioSnapshot snapshot;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// RiskAlertEvent
// -----------------------------------------------------------------------------
// Published by DecisionOrchestrator when the composite risk score of a cycle
// reaches the high-risk threshold.
// -----------------------------------------------------------------------------
struct RiskAlertEvent {
  std::string symbol;
  double risk_score{0.0};
  double threshold{0.0};
  std::vector<std::string> advisories;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// RunProgressEvent
// -----------------------------------------------------------------------------
// Published by SimulationEngine at run start, after each simulated day, and
// at run end.
// -----------------------------------------------------------------------------
struct RunProgressEvent {
  std::string run_id;
  std::string phase;  // "started" | "day" | "finished" | "cancelled"
  Timestamp simulated_date{};
  int days_done{0};
  int days_total{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace backtest
