#pragma once

#include "backtest/domain/portfolio_state.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/domain/risk_metrics.hpp"
#include "backtest/domain/trading_decision.hpp"
#include "backtest/domain/transaction.hpp"
#include "backtest/time/time_utils.hpp"

#include <optional>
#include <string>
#include <vector>

namespace backtest {
namespace domain {

// What happened to a decision once it reached (or failed to reach) phase 6.
enum class ExecutionOutcome { Filled, Rejected, Hold, Skipped, Cancelled };

const char* to_string(ExecutionOutcome outcome);

// -----------------------------------------------------------------------------
// DecisionRecord: one entry of the per-decision audit trail
// -----------------------------------------------------------------------------
struct DecisionRecord {
  TradingDecision decision;
  ExecutionOutcome outcome{ExecutionOutcome::Hold};
  std::optional<Transaction> transaction;
  std::string reason;
  EnhancedRiskMetrics risk_metrics;
};

// Shape handed to the persistence collaborator after each executed trade.
struct AuditRecord {
  TradingDecision decision;
  Transaction transaction;
  Timestamp stored_at{};
};

// -----------------------------------------------------------------------------
// BacktestResult: the outcome of SimulationEngine::run()
// -----------------------------------------------------------------------------
//
// @details
// Always produced unless configuration validation failed. A cancelled run
// still returns everything recorded up to the cancellation point, with
// `cancelled` set.
// -----------------------------------------------------------------------------
struct BacktestResult {
  std::string run_id;
  PortfolioState final_state;
  std::vector<Transaction> transactions;
  std::vector<DecisionRecord> decisions;
  std::vector<EnhancedRiskMetrics> risk_snapshots;
  std::vector<PortfolioSnapshot> equity_curve;
  std::vector<ClosedPosition> closed_positions;
  double initial_capital{0.0};
  int trading_days{0};
  bool cancelled{false};
  Timestamp started_at{};
  Timestamp finished_at{};
};

}  // namespace domain
}  // namespace backtest
