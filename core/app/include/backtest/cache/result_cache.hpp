#pragma once

#include "backtest/domain/agent_opinion.hpp"
#include "backtest/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace backtest {

// Counters reported by ResultCache::stats().
struct CacheStats {
  std::uint64_t hits{0};
  std::uint64_t misses{0};
  std::uint64_t evictions{0};
  std::uint64_t expirations{0};
  std::size_t size{0};

  double hitRate() const {
    const std::uint64_t total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / total;
  }
};

// -----------------------------------------------------------------------------
// ResultCache: TTL + LRU cache of validated agent opinions
// -----------------------------------------------------------------------------
//
// @brief  Maps a normalized request key to a previously produced
//         AgentOpinion so repeated (role, context) requests skip the
//         DecisionProvider entirely.
//
// @details
// Entries live in a recency list (front = most recently used) indexed by an
// unordered_map. get() refreshes recency; put() evicts from the back when
// the cache is full.
//
// Expiry is authoritative over LRU order: get() never returns an expired
// entry even if it is the most recently used one, and put() sweeps every
// expired entry before deciding whether an LRU eviction is needed.
//
// Time comes from the injected ITimeProvider, so TTLs are measured in
// whatever clock the owner runs on (live clock in production, simulated
// clock in tests).
//
// Thread model:
//   All public methods are safe from any thread (one internal mutex). Phase
//   fan-out in the orchestrator hits the cache from several workers at once.
//
// Ownership:
//   Owned by DecisionOrchestrator. Holds a non-owning reference to the time
//   provider, which must outlive the cache.
// -----------------------------------------------------------------------------
class ResultCache {
 public:
  // @throws InvalidConfiguration if capacity <= 0 or default_ttl_ms <= 0.
  ResultCache(const ITimeProvider& clock, long long capacity,
              std::int64_t default_ttl_ms);

  ResultCache(const ResultCache&) = delete;
  ResultCache& operator=(const ResultCache&) = delete;

  std::optional<domain::AgentOpinion> get(const std::string& key);

  void put(const std::string& key, domain::AgentOpinion value);
  void put(const std::string& key, domain::AgentOpinion value,
           std::int64_t ttl_ms);

  // Removes all expired entries. Returns how many were removed.
  std::size_t purgeExpired();

  void clear();

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  CacheStats stats() const;

  // -------------------------------------------------------------------------
  // makeKey(role, context)
  // -------------------------------------------------------------------------
  //
  // @brief  "<role>:<16 hex digits>" where the digits are a 64-bit FNV-1a
  //         hash of the context serialized with sorted keys.
  //
  // @details
  // Volatile fields ("request_id", "generated_at", "wall_time") are removed
  // at every nesting level before hashing, so two requests that differ only
  // in bookkeeping produce the same key. nlohmann::json objects keep their
  // keys sorted, which makes dump() a stable normal form.
  // -------------------------------------------------------------------------
  static std::string makeKey(domain::AgentRole role,
                             const nlohmann::json& context);

 private:
  struct Entry {
    std::string key;
    domain::AgentOpinion value;
    std::int64_t created_ms{0};
    std::int64_t last_access_ms{0};
    std::int64_t expires_ms{0};
  };

  using EntryList = std::list<Entry>;

  std::size_t purgeExpiredLocked(std::int64_t now);
  void eraseLocked(EntryList::iterator it);

  const ITimeProvider& clock_;
  std::size_t capacity_{0};
  std::int64_t default_ttl_ms_{0};

  mutable std::mutex mutex_;
  EntryList entries_;
  std::unordered_map<std::string, EntryList::iterator> index_;
  CacheStats stats_;
};

}  // namespace backtest
