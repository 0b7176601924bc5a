#pragma once

// =============================================================================
// test_support.hpp
// =============================================================================
// Fakes shared by the test executables: a hand-driven clock, a scriptable
// decision provider, an in-memory market data feed and a recording
// persistence sink. Header-only; every test executable compiles its own copy.
// =============================================================================

#include "backtest/agents/i_decision_provider.hpp"
#include "backtest/agents/rule_based_decision_provider.hpp"
#include "backtest/data/i_market_data_provider.hpp"
#include "backtest/domain/agent_opinion.hpp"
#include "backtest/domain/market_snapshot.hpp"
#include "backtest/persistence/i_persistence_collaborator.hpp"
#include "backtest/time/i_time_provider.hpp"
#include "backtest/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace backtest {
namespace testing_support {

// Clock that only moves when the test says so.
class ManualClock : public ITimeProvider {
 public:
  explicit ManualClock(std::int64_t start_ms = 1'700'000'000'000)
      : now_(start_ms) {}

  std::int64_t now_ms() const override { return now_.load(); }
  void set(std::int64_t ms) { now_.store(ms); }
  void advance(std::int64_t delta_ms) { now_.fetch_add(delta_ms); }

 private:
  std::atomic<std::int64_t> now_;
};

// -----------------------------------------------------------------------------
// ScriptedProvider
// -----------------------------------------------------------------------------
// Answers with RuleBasedDecisionProvider unless a script is installed for
// the role. Counts invocations per role. Thread-safe.
// -----------------------------------------------------------------------------
class ScriptedProvider : public IDecisionProvider {
 public:
  using Script = std::function<ProviderResponse(const nlohmann::json&)>;

  ProviderResponse generate(domain::AgentRole role,
                            const nlohmann::json& context) override {
    Script script;
    {
      std::lock_guard lock(mutex_);
      ++calls_[role];
      auto it = scripts_.find(role);
      if (it != scripts_.end()) {
        script = it->second;
      }
    }
    if (script) {
      return script(context);
    }
    return fallback_.generate(role, context);
  }

  void script(domain::AgentRole role, Script s) {
    std::lock_guard lock(mutex_);
    scripts_[role] = std::move(s);
  }

  int calls(domain::AgentRole role) const {
    std::lock_guard lock(mutex_);
    auto it = calls_.find(role);
    return it == calls_.end() ? 0 : it->second;
  }

  int totalCalls() const {
    std::lock_guard lock(mutex_);
    int total = 0;
    for (const auto& [role, n] : calls_) {
      total += n;
    }
    return total;
  }

 private:
  mutable std::mutex mutex_;
  std::map<domain::AgentRole, Script> scripts_;
  std::map<domain::AgentRole, int> calls_;
  RuleBasedDecisionProvider fallback_;
};

inline ProviderResponse respond(nlohmann::json payload, double confidence,
                                std::string rationale = "scripted") {
  return ProviderResponse{std::move(payload), confidence,
                          std::move(rationale)};
}

inline ProviderResponse advocacy(const std::string& recommendation,
                                 double confidence) {
  return respond({{"recommendation", recommendation},
                  {"key_points", nlohmann::json::array({"scripted"})}},
                 confidence);
}

inline ProviderResponse stance(const std::string& name, bool endorses,
                               double confidence) {
  return respond({{"stance", name}, {"endorses_trade", endorses}},
                 confidence);
}

// -----------------------------------------------------------------------------
// Bars
// -----------------------------------------------------------------------------
inline domain::MarketSnapshot makeBar(const std::string& symbol,
                                      const std::string& date, double close,
                                      double open = 0.0) {
  domain::MarketSnapshot bar;
  bar.symbol = symbol;
  bar.date = parse_date(date);
  bar.open = open > 0.0 ? open : close;
  bar.high = std::max(bar.open, close) * 1.01;
  bar.low = std::min(bar.open, close) * 0.99;
  bar.close = close;
  bar.volume = 1'000'000.0;
  return bar;
}

// Weekday bars from `first_date`, closes following `price(i)`.
inline std::vector<domain::MarketSnapshot> weekdayBars(
    const std::string& symbol, const std::string& first_date, int count,
    const std::function<double(int)>& price) {
  std::vector<domain::MarketSnapshot> bars;
  Timestamp day = parse_date(first_date);
  int i = 0;
  while (i < count) {
    if (!is_weekend(day)) {
      const double close = price(i);
      const double open = i == 0 ? close : price(i - 1);
      bars.push_back(makeBar(symbol, format_date(day), close, open));
      ++i;
    }
    day = add_days(day, 1);
  }
  return bars;
}

class InMemoryMarketData : public IMarketDataProvider {
 public:
  void add(const domain::MarketSnapshot& bar) {
    bars_[{bar.symbol, days_from_epoch(bar.date)}] = bar;
  }

  void add(const std::vector<domain::MarketSnapshot>& bars) {
    for (const auto& bar : bars) {
      add(bar);
    }
  }

  std::optional<domain::MarketSnapshot> get(const std::string& symbol,
                                            Timestamp date) const override {
    auto it = bars_.find({symbol, days_from_epoch(date)});
    if (it == bars_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

 private:
  static std::int64_t days_from_epoch(Timestamp t) {
    return timestamp_to_ms(start_of_day(t)) / kMillisPerDay;
  }

  std::map<std::pair<std::string, std::int64_t>, domain::MarketSnapshot> bars_;
};

class RecordingPersistence : public IPersistenceCollaborator {
 public:
  void save(const std::string& symbol,
            const domain::AuditRecord& record) override {
    std::lock_guard lock(mutex_);
    if (fail_) {
      throw std::runtime_error("disk full");
    }
    saved_.emplace_back(symbol, record);
  }

  void failWrites() {
    std::lock_guard lock(mutex_);
    fail_ = true;
  }

  std::vector<std::pair<std::string, domain::AuditRecord>> saved() const {
    std::lock_guard lock(mutex_);
    return saved_;
  }

 private:
  mutable std::mutex mutex_;
  bool fail_{false};
  std::vector<std::pair<std::string, domain::AuditRecord>> saved_;
};

// Backoff sleeper that returns immediately and remembers what was asked.
class RecordingSleeper {
 public:
  void operator()(std::chrono::milliseconds d) {
    std::lock_guard lock(*mutex_);
    delays_->push_back(d);
  }

  std::vector<std::chrono::milliseconds> delays() const {
    std::lock_guard lock(*mutex_);
    return *delays_;
  }

 private:
  std::shared_ptr<std::mutex> mutex_ = std::make_shared<std::mutex>();
  std::shared_ptr<std::vector<std::chrono::milliseconds>> delays_ =
      std::make_shared<std::vector<std::chrono::milliseconds>>();
};

inline void noSleep(std::chrono::milliseconds) {}

}  // namespace testing_support
}  // namespace backtest
