#pragma once

#include "backtest/domain/agent_opinion.hpp"
#include "backtest/domain/trade_action.hpp"
#include "backtest/time/time_utils.hpp"

#include <string>
#include <vector>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// RiskAssessment: output of the RiskDiscussion phase
// -----------------------------------------------------------------------------
//
// @brief  Winning stance, the three stance scores it was chosen from, and
//         the RiskAnalyzer figures that shaped the position size.
//
// @details
// Scores are the confidences of the three stance opinions. size_adjustment
// is RiskAnalyzer's multiplier in [min_total_adjustment, max bonus]; the
// PositionManager applies it when sizing.
// -----------------------------------------------------------------------------
struct RiskAssessment {
  RiskStance stance{RiskStance::Neutral};
  double aggressive_score{0.0};
  double neutral_score{0.0};
  double conservative_score{0.0};
  std::vector<std::string> key_risks;

  double size_adjustment{1.0};
  double risk_score{0.0};  // [0, 100]
  std::vector<std::string> advisories;
};

// -----------------------------------------------------------------------------
// TradingDecision
// -----------------------------------------------------------------------------
//
// @brief  The single result of one decision cycle for one (symbol, date).
//
// @details
// quantity == 0 means "size determined downstream" by
// PositionManager::sizeFor(). The percentages are fractions (0.10 = 10%).
// Immutable after DecisionOrchestrator returns it; the audit trail stores
// copies.
// -----------------------------------------------------------------------------
struct TradingDecision {
  std::string id;
  Timestamp timestamp{};
  TradeAction action{TradeAction::Hold};
  std::string symbol;
  double quantity{0.0};
  OrderKind order_kind{OrderKind::Market};
  double confidence{0.0};
  std::string rationale;
  double position_size_pct{0.0};
  double stop_loss_pct{0.0};
  double take_profit_pct{0.0};
  RiskAssessment risk;
  std::vector<AgentOpinion> opinions;
};

}  // namespace domain
}  // namespace backtest
