#pragma once

#include "backtest/concurrent/bounded_history.hpp"
#include "backtest/domain/agent_opinion.hpp"
#include "backtest/domain/market_snapshot.hpp"
#include "backtest/domain/trading_decision.hpp"

#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// MemoryStore: bounded recall for decision cycles
// -----------------------------------------------------------------------------
//
// @brief  Keeps the recent price bars per symbol, the recent opinions per
//         agent role and the recent decisions per symbol, each in its own
//         BoundedHistory.
//
// @details
// DataCollection reads bars from here; the orchestrator feeds each role its
// own last few opinions as "memory" in the provider context, and records
// every new opinion and decision once a cycle completes. Nothing grows
// without bound: the oldest entry is overwritten once a history is full.
//
// Thread model:
//   Decision cycles for different symbols may run concurrently. Writers take
//   a unique lock, readers a shared lock; every reader returns copies.
// -----------------------------------------------------------------------------
class MemoryStore {
 public:
  MemoryStore(long long price_capacity, long long agent_capacity);

  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  // Ignores a bar whose date is not after the latest stored bar.
  void recordBar(const domain::MarketSnapshot& bar);
  std::vector<domain::MarketSnapshot> recentBars(const std::string& symbol,
                                                 std::size_t n) const;
  std::size_t barCount(const std::string& symbol) const;

  void recordOpinion(const domain::AgentOpinion& opinion);
  std::vector<domain::AgentOpinion> recentOpinions(domain::AgentRole role,
                                                   std::size_t n) const;

  void recordDecision(const domain::TradingDecision& decision);
  std::vector<domain::TradingDecision> recentDecisions(
      const std::string& symbol, std::size_t n) const;

  void clear();

 private:
  const long long price_capacity_;
  const long long agent_capacity_;

  mutable std::shared_mutex mutex_;
  std::map<std::string, BoundedHistory<domain::MarketSnapshot>> bars_;
  std::map<domain::AgentRole, BoundedHistory<domain::AgentOpinion>> opinions_;
  std::map<std::string, BoundedHistory<domain::TradingDecision>> decisions_;
};

}  // namespace backtest
