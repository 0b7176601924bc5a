#pragma once

#include "backtest/domain/agent_opinion.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace backtest {

// Raw answer of a decision provider, before OpinionParser validates it.
struct ProviderResponse {
  nlohmann::json payload;
  double confidence{0.0};
  std::string rationale;
};

// -----------------------------------------------------------------------------
// IDecisionProvider: the external "agent" capability
// -----------------------------------------------------------------------------
//
// @brief  Produces the opinion payload for one agent role given a JSON
//         context built by DecisionOrchestrator.
//
// @details
// In production this fronts a hosted model; the repository ships
// RuleBasedDecisionProvider. The payload shape expected per role is
// documented on OpinionParser.
//
// Implementations may throw TimeoutError or ProviderError for transient
// failures (ResilientCaller retries those) and MalformedOutput when they
// produced something that is not a JSON object (not retried).
//
// Thread model:
//   generate() is called concurrently from the orchestrator's worker pool
//   and, on timeout, may still be running after the caller gave up.
//   Implementations must be thread-safe.
// -----------------------------------------------------------------------------
class IDecisionProvider {
 public:
  virtual ~IDecisionProvider() = default;

  virtual ProviderResponse generate(domain::AgentRole role,
                                    const nlohmann::json& context) = 0;
};

}  // namespace backtest
