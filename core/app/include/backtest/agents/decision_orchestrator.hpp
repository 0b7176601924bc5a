#pragma once

#include "backtest/agents/i_decision_provider.hpp"
#include "backtest/cache/result_cache.hpp"
#include "backtest/concurrent/sequence_generator.hpp"
#include "backtest/concurrent/worker_pool.hpp"
#include "backtest/config/backtest_config.hpp"
#include "backtest/domain/backtest_result.hpp"
#include "backtest/domain/market_snapshot.hpp"
#include "backtest/domain/portfolio_state.hpp"
#include "backtest/eventbus/event_bus.hpp"
#include "backtest/memory/memory_store.hpp"
#include "backtest/portfolio/position_manager.hpp"
#include "backtest/resilience/resilient_caller.hpp"
#include "backtest/risk/risk_analyzer.hpp"
#include "backtest/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace backtest {

// Output of phases 1-5, input of phase 6. `portfolio` is the state the
// decision was reasoned about; phase 6 sizes against it.
struct PendingDecision {
  domain::TradingDecision decision;
  domain::EnhancedRiskMetrics metrics;
  domain::PortfolioState portfolio;
  double price{0.0};
  bool cancelled{false};
};

// -----------------------------------------------------------------------------
// DecisionOrchestrator: six-phase decision cycle for one (symbol, date)
// -----------------------------------------------------------------------------
//
// @brief  Turns a market snapshot into a TradingDecision by consulting the
//         agent roles, then hands the decision to PositionManager.
//
// @details
// Phases, strictly sequential:
//
//   1. DataCollection         Record the bar in MemoryStore, read back the
//                             recent window. No provider call.
//   2. IndividualAnalysis     technical / sentiment / news / fundamentals,
//                             fanned out on the worker pool.
//   3. CollaborativeAnalysis  bull then bear, each seeing the analysts.
//                             Each further debate round (max_debate_rounds
//                             in total) asks both again with their own and
//                             the opposing latest opinion under "debate".
//                             Synthesis: the stronger side (by confidence)
//                             wins if it recommends its own direction,
//                             otherwise HOLD; conviction = |bull - bear|.
//   4. RiskDiscussion         RiskAnalyzer metrics, then aggressive /
//                             conservative / neutral fanned out. Further
//                             rounds (max_risk_discuss_rounds in total) fan
//                             out again with every stance's latest opinion
//                             under "discussion".
//   5. FinalDecision          The strictly greatest stance score wins, a
//                             tie goes to NEUTRAL; a degraded stance scores
//                             0. position_size_pct = default_position_pct *
//                             stance multiplier (the winning stance's own
//                             size_multiplier when it gives one);
//                             confidence = max(bull, bear) * 0.5 *
//                             (1 + agreement), agreement being the share of
//                             stances that endorse the trade. Below
//                             min_confidence the action becomes HOLD.
//   6. Execution              Size with PositionManager::sizeFor() against
//                             the portfolio the decision saw, then execute
//                             against the live portfolio. A fill committed
//                             in between can leave too little cash; the
//                             rejection is recorded as REJECTED, never
//                             thrown.
//
// Every opinion goes ResultCache → ResilientCaller → OpinionParser. Any
// failure on that path (circuit open, retries exhausted, malformed payload,
// phase deadline) yields a degraded NeutralView with degraded_confidence
// instead of an exception, so a cycle always produces a decision.
//
// Fan-in waits for each phase at most call_deadline_ms per role in the
// phase; a role still running after that is replaced by a placeholder.
//
// decide() runs phases 1-5 and execute() runs phase 6, so the engine can
// produce decisions for several symbols in parallel while keeping every
// PositionManager call on one thread in a fixed order. Cancellation is
// observed between phases; a cancelled cycle finishes its current phase and
// execute() then records it as CANCELLED without touching the portfolio.
//
// Thread model:
//   decide() is safe to call concurrently for different symbols.
//   execute() must be serialized by the caller.
//
// Ownership:
//   Owns the cache, the resilient caller, the risk analyzer and the worker
//   pool (declared last so its threads are joined first). Holds
//   non-owning references to the clock, PositionManager and MemoryStore,
//   and an optional EventBus pointer; all must outlive the orchestrator.
// -----------------------------------------------------------------------------
class DecisionOrchestrator {
 public:
  DecisionOrchestrator(const BacktestConfig& config,
                       std::shared_ptr<IDecisionProvider> provider,
                       const ITimeProvider& clock, PositionManager& positions,
                       MemoryStore& memory, EventBus* bus = nullptr,
                       ResilientCaller::Sleeper sleeper = {});

  DecisionOrchestrator(const DecisionOrchestrator&) = delete;
  DecisionOrchestrator& operator=(const DecisionOrchestrator&) = delete;

  PendingDecision decide(const domain::MarketSnapshot& snapshot,
                         const domain::PortfolioState& portfolio,
                         const std::atomic<bool>& cancel);

  domain::DecisionRecord execute(PendingDecision pending);

  domain::DecisionRecord runCycle(const domain::MarketSnapshot& snapshot,
                                  const std::atomic<bool>& cancel);

  // Nullopt when caching is disabled.
  std::optional<CacheStats> cacheStats() const;
  std::vector<ChannelStatus> channelStatuses() const;
  std::uint64_t providerInvocations() const;

 private:
  struct Research {
    domain::TradeAction action{domain::TradeAction::Hold};
    double bull{0.0};
    double bear{0.0};
    double conviction{0.0};
  };

  domain::AgentOpinion obtainOpinion(domain::AgentRole role,
                                     const nlohmann::json& context,
                                     Timestamp timestamp);
  std::vector<domain::AgentOpinion> fanOut(
      const std::vector<domain::AgentRole>& roles,
      const nlohmann::json& context, Timestamp timestamp);

  nlohmann::json baseContext(const domain::MarketSnapshot& snapshot,
                             const std::vector<domain::MarketSnapshot>& bars,
                             const domain::PortfolioState& portfolio) const;
  nlohmann::json withMemory(domain::AgentRole role,
                            nlohmann::json context) const;
  static nlohmann::json opinionsJson(
      const std::vector<domain::AgentOpinion>& opinions);
  static nlohmann::json opinionJson(const domain::AgentOpinion& opinion);

  static Research synthesize(const domain::AgentOpinion& bull,
                             const domain::AgentOpinion& bear);
  domain::EnhancedRiskMetrics assessRisk(
      const std::string& symbol,
      const std::vector<domain::MarketSnapshot>& bars,
      const domain::PortfolioState& portfolio) const;
  void finalize(domain::TradingDecision& decision, const Research& research,
                const std::vector<domain::AgentOpinion>& stances,
                const domain::EnhancedRiskMetrics& metrics) const;
  std::vector<std::string> keyRisks(
      const domain::EnhancedRiskMetrics& metrics) const;

  void trace(const std::string& symbol, const std::string& message) const;
  void publish(const Event& event);

  const OrchestratorConfig config_;
  const PositionConfig position_config_;
  const std::chrono::milliseconds call_deadline_;
  const bool debug_;

  const ITimeProvider& clock_;
  PositionManager& positions_;
  MemoryStore& memory_;
  EventBus* bus_;

  RiskAnalyzer analyzer_;
  std::unique_ptr<ResultCache> cache_;
  std::unique_ptr<ResilientCaller> caller_;
  SequenceGenerator event_sequence_;

  std::unique_ptr<WorkerPool> pool_;
};

}  // namespace backtest
