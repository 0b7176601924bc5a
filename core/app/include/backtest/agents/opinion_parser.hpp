#pragma once

#include "backtest/agents/i_decision_provider.hpp"
#include "backtest/domain/agent_opinion.hpp"
#include "backtest/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// OpinionParser: schema validation of provider payloads
// -----------------------------------------------------------------------------
//
// @brief  Turns a ProviderResponse into a typed AgentOpinion, or throws
//         MalformedOutput.
//
// @details
// Expected payload per role (required keys marked *):
//
//   technical      signal* (action text), trend, rsi, macd
//   sentiment      score* in [-1, 1]
//   news           sentiment* in [-1, 1], article_count >= 0
//   fundamentals   valuation* in {undervalued, fairly_valued, overvalued},
//                  revenue_growth, debt_to_equity
//   bull / bear    recommendation* (action text), key_points (string array)
//   aggressive /   stance* (must match the role), endorses_trade* (bool),
//   conservative / size_multiplier > 0, stop_loss_pct, take_profit_pct
//   neutral        in (0, 1]
//
// Response confidence must be a finite number in [0, 1].
//
// Parsing uses json::at() so a missing key or wrong type raises a
// nlohmann::json::exception, which is converted to MalformedOutput with
// the role in the message. Nothing here logs; the orchestrator decides what
// a rejected payload turns into.
// -----------------------------------------------------------------------------
class OpinionParser {
 public:
  static domain::OpinionContent parseContent(domain::AgentRole role,
                                             const nlohmann::json& payload);

  static domain::AgentOpinion parse(domain::AgentRole role,
                                    const ProviderResponse& response,
                                    Timestamp timestamp,
                                    std::chrono::milliseconds processing_time);

  // Low-confidence NeutralView placeholder marked degraded.
  static domain::AgentOpinion neutral(domain::AgentRole role,
                                      std::string reason, double confidence,
                                      Timestamp timestamp);

  static nlohmann::json contentToJson(const domain::OpinionContent& content);
  static nlohmann::json toJson(const domain::AgentOpinion& opinion);
};

}  // namespace backtest
