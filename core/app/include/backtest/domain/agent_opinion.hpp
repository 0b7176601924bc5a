#pragma once

#include "backtest/domain/trade_action.hpp"
#include "backtest/time/time_utils.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// AgentRole
// -----------------------------------------------------------------------------
// One value per sub-opinion the DecisionOrchestrator requests. The role is
// also the ResilientCaller channel name, so circuit state is independent per
// role.
// -----------------------------------------------------------------------------
enum class AgentRole {
  Technical,
  Sentiment,
  News,
  Fundamentals,
  Bull,
  Bear,
  Aggressive,
  Conservative,
  Neutral
};

const char* to_string(AgentRole role);
std::optional<AgentRole> parse_agent_role(const std::string& text);

// -----------------------------------------------------------------------------
// Typed opinion payloads, one per role family
// -----------------------------------------------------------------------------
// Produced only by OpinionParser from validated provider JSON. Fields the
// provider may omit carry defaults here; required fields are enforced by the
// parser.
// -----------------------------------------------------------------------------

// Technical analyst: direction from price action and indicators.
struct TechnicalView {
  TradeAction signal{TradeAction::Hold};
  std::string trend;  // "bullish" | "bearish" | "neutral"
  double rsi{50.0};
  double macd{0.0};
};

// Social/market sentiment analyst: score in [-1, 1].
struct SentimentView {
  double score{0.0};
};

// News analyst.
struct NewsView {
  double sentiment{0.0};  // [-1, 1]
  int article_count{0};
};

// Fundamentals analyst.
struct FundamentalsView {
  std::string valuation;  // "undervalued" | "fairly_valued" | "overvalued"
  double revenue_growth{0.0};
  double debt_to_equity{0.0};
};

// Bull or bear researcher.
struct AdvocacyView {
  TradeAction recommendation{TradeAction::Hold};
  std::vector<std::string> key_points;
};

// Aggressive / conservative / neutral risk debater.
struct StanceView {
  RiskStance stance{RiskStance::Neutral};
  std::optional<double> size_multiplier;
  bool endorses_trade{false};
  std::optional<double> stop_loss_pct;
  std::optional<double> take_profit_pct;
};

// Placeholder substituted when a call failed or its payload was rejected.
struct NeutralView {
  std::string reason;
};

using OpinionContent = std::variant<NeutralView,
                                    TechnicalView,
                                    SentimentView,
                                    NewsView,
                                    FundamentalsView,
                                    AdvocacyView,
                                    StanceView>;

// -----------------------------------------------------------------------------
// AgentOpinion
// -----------------------------------------------------------------------------
//
// @brief  One sub-opinion inside a decision cycle.
//
// @details
// Created once per invocation (or served from ResultCache) and never
// mutated. `degraded` marks placeholders so the synthesis and final-decision
// phases can discount them and the audit trail shows which inputs were
// real.
// -----------------------------------------------------------------------------
struct AgentOpinion {
  AgentRole role{AgentRole::Technical};
  std::string agent_id;
  Timestamp timestamp{};
  OpinionContent content{NeutralView{}};
  double confidence{0.0};  // [0, 1]
  std::string rationale;
  std::chrono::milliseconds processing_time{0};
  bool degraded{false};
};

}  // namespace domain
}  // namespace backtest
