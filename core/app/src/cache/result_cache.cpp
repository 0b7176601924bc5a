#include "backtest/cache/result_cache.hpp"

#include "backtest/error/errors.hpp"

#include <array>
#include <cstdio>
#include <iterator>
#include <utility>

namespace backtest {

namespace {

constexpr std::array<const char*, 3> kVolatileFields{
    "request_id", "generated_at", "wall_time"};

void strip_volatile(nlohmann::json& node) {
  if (node.is_object()) {
    for (const char* field : kVolatileFields) {
      node.erase(field);
    }
  }
  if (node.is_structured()) {
    for (auto& child : node) {
      strip_volatile(child);
    }
  }
}

std::uint64_t fnv1a(const std::string& text) {
  std::uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

}  // namespace

ResultCache::ResultCache(const ITimeProvider& clock, long long capacity,
                         std::int64_t default_ttl_ms)
    : clock_(clock), default_ttl_ms_(default_ttl_ms) {
  if (capacity <= 0) {
    throw InvalidConfiguration("ResultCache capacity must be positive");
  }
  if (default_ttl_ms <= 0) {
    throw InvalidConfiguration("ResultCache ttl must be positive");
  }
  capacity_ = static_cast<std::size_t>(capacity);
}

// -----------------------------------------------------------------------------
// get(): expiry first, then recency refresh
// -----------------------------------------------------------------------------
std::optional<domain::AgentOpinion> ResultCache::get(const std::string& key) {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();

  auto found = index_.find(key);
  if (found == index_.end()) {
    ++stats_.misses;
    return std::nullopt;
  }

  EntryList::iterator it = found->second;
  if (it->expires_ms <= now) {
    eraseLocked(it);
    ++stats_.expirations;
    ++stats_.misses;
    return std::nullopt;
  }

  it->last_access_ms = now;
  entries_.splice(entries_.begin(), entries_, it);
  ++stats_.hits;
  return it->value;
}

void ResultCache::put(const std::string& key, domain::AgentOpinion value) {
  put(key, std::move(value), default_ttl_ms_);
}

void ResultCache::put(const std::string& key, domain::AgentOpinion value,
                      std::int64_t ttl_ms) {
  std::lock_guard lock(mutex_);
  const std::int64_t now = clock_.now_ms();

  purgeExpiredLocked(now);

  auto found = index_.find(key);
  if (found != index_.end()) {
    EntryList::iterator it = found->second;
    it->value = std::move(value);
    it->created_ms = now;
    it->last_access_ms = now;
    it->expires_ms = now + ttl_ms;
    entries_.splice(entries_.begin(), entries_, it);
    return;
  }

  if (entries_.size() >= capacity_) {
    eraseLocked(std::prev(entries_.end()));
    ++stats_.evictions;
  }

  entries_.push_front(Entry{key, std::move(value), now, now, now + ttl_ms});
  index_[key] = entries_.begin();
}

std::size_t ResultCache::purgeExpired() {
  std::lock_guard lock(mutex_);
  return purgeExpiredLocked(clock_.now_ms());
}

void ResultCache::clear() {
  std::lock_guard lock(mutex_);
  entries_.clear();
  index_.clear();
}

std::size_t ResultCache::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

CacheStats ResultCache::stats() const {
  std::lock_guard lock(mutex_);
  CacheStats out = stats_;
  out.size = entries_.size();
  return out;
}

std::string ResultCache::makeKey(domain::AgentRole role,
                                 const nlohmann::json& context) {
  nlohmann::json normalized = context;
  strip_volatile(normalized);

  char digest[17];
  std::snprintf(digest, sizeof(digest), "%016llx",
                static_cast<unsigned long long>(fnv1a(normalized.dump())));
  return std::string(domain::to_string(role)) + ":" + digest;
}

std::size_t ResultCache::purgeExpiredLocked(std::int64_t now) {
  std::size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    auto next = std::next(it);
    if (it->expires_ms <= now) {
      eraseLocked(it);
      ++removed;
    }
    it = next;
  }
  stats_.expirations += removed;
  return removed;
}

void ResultCache::eraseLocked(EntryList::iterator it) {
  index_.erase(it->key);
  entries_.erase(it);
}

}  // namespace backtest
