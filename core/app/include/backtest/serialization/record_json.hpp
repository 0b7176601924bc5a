#pragma once

#include "backtest/domain/backtest_result.hpp"
#include "backtest/domain/market_snapshot.hpp"
#include "backtest/domain/portfolio_state.hpp"
#include "backtest/domain/risk_metrics.hpp"
#include "backtest/domain/trading_decision.hpp"
#include "backtest/domain/transaction.hpp"

#include <nlohmann/json.hpp>

namespace backtest {

// -----------------------------------------------------------------------------
// JSON views of engine records
// -----------------------------------------------------------------------------
//
// @brief  One explicit builder per record type, shared by the provider
//         context, the audit log, IPC telemetry and the CLI summary.
//
// @details
// Field names are snake_case and stable; dates are "YYYY-MM-DD", enums use
// their to_string() spelling. Nothing here parses; reading JSON back is
// done field by field where it is needed (ConfigLoader,
// JsonMarketDataProvider) so each reader reports its own errors.
// -----------------------------------------------------------------------------

nlohmann::json toJson(const domain::MarketSnapshot& snapshot);
nlohmann::json toJson(const domain::Position& position);
nlohmann::json toJson(const domain::PortfolioState& state);
nlohmann::json toJson(const domain::PortfolioSnapshot& snapshot);
nlohmann::json toJson(const domain::Transaction& transaction);
nlohmann::json toJson(const domain::RiskAssessment& assessment);
nlohmann::json toJson(const domain::EnhancedRiskMetrics& metrics);

// Includes every opinion unless with_opinions is false.
nlohmann::json toJson(const domain::TradingDecision& decision,
                      bool with_opinions = true);

nlohmann::json toJson(const domain::DecisionRecord& record);
nlohmann::json toJson(const domain::AuditRecord& record);
nlohmann::json toJson(const domain::ClosedPosition& closed);

// Totals and counts only; transactions and decisions are summarized.
nlohmann::json summaryJson(const domain::BacktestResult& result);

}  // namespace backtest
