#include "backtest/memory/memory_store.hpp"

#include "backtest/error/errors.hpp"

#include <mutex>

namespace backtest {

MemoryStore::MemoryStore(long long price_capacity, long long agent_capacity)
    : price_capacity_(price_capacity), agent_capacity_(agent_capacity) {
  if (price_capacity <= 0 || agent_capacity <= 0) {
    throw InvalidConfiguration("MemoryStore capacities must be positive");
  }
}

void MemoryStore::recordBar(const domain::MarketSnapshot& bar) {
  std::unique_lock lock(mutex_);
  auto& history = bars_.try_emplace(bar.symbol, price_capacity_).first->second;
  if (auto latest = history.latest(); latest && !(latest->date < bar.date)) {
    return;
  }
  history.append(bar);
}

std::vector<domain::MarketSnapshot> MemoryStore::recentBars(
    const std::string& symbol, std::size_t n) const {
  std::shared_lock lock(mutex_);
  auto it = bars_.find(symbol);
  if (it == bars_.end()) {
    return {};
  }
  return it->second.last(n);
}

std::size_t MemoryStore::barCount(const std::string& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = bars_.find(symbol);
  return it == bars_.end() ? 0 : it->second.size();
}

void MemoryStore::recordOpinion(const domain::AgentOpinion& opinion) {
  std::unique_lock lock(mutex_);
  opinions_.try_emplace(opinion.role, agent_capacity_)
      .first->second.append(opinion);
}

std::vector<domain::AgentOpinion> MemoryStore::recentOpinions(
    domain::AgentRole role, std::size_t n) const {
  std::shared_lock lock(mutex_);
  auto it = opinions_.find(role);
  if (it == opinions_.end()) {
    return {};
  }
  return it->second.last(n);
}

void MemoryStore::recordDecision(const domain::TradingDecision& decision) {
  std::unique_lock lock(mutex_);
  decisions_.try_emplace(decision.symbol, agent_capacity_)
      .first->second.append(decision);
}

std::vector<domain::TradingDecision> MemoryStore::recentDecisions(
    const std::string& symbol, std::size_t n) const {
  std::shared_lock lock(mutex_);
  auto it = decisions_.find(symbol);
  if (it == decisions_.end()) {
    return {};
  }
  return it->second.last(n);
}

void MemoryStore::clear() {
  std::unique_lock lock(mutex_);
  bars_.clear();
  opinions_.clear();
  decisions_.clear();
}

}  // namespace backtest
