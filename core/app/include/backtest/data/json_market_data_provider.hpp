#pragma once

#include "backtest/data/i_market_data_provider.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// JsonMarketDataProvider: daily bars loaded once from a JSON document
// -----------------------------------------------------------------------------
//
// @brief  IMarketDataProvider over an in-memory index built at construction.
//
// @details
// Accepted document shapes:
//
//   { "bars": [ <bar>, ... ] }   or   [ <bar>, ... ]
//
//   <bar> = { "symbol": "AAPL", "date": "2024-01-02",
//             "open": 1.0, "high": 1.0, "low": 1.0, "close": 1.0,
//             "volume": 1000,                      // optional, default 0
//             "indicators": { "rsi": 55.0, ... },  // optional
//             "news_sentiment": [0.2, -0.1] }      // optional
//
// A bar that fails to parse, or whose prices are not positive, is logged
// and skipped; the rest of the document still loads. A later bar for the
// same (symbol, date) replaces the earlier one.
//
// Thread model:
//   Immutable after construction; get() is safe from any thread.
// -----------------------------------------------------------------------------
class JsonMarketDataProvider : public IMarketDataProvider {
 public:
  explicit JsonMarketDataProvider(const nlohmann::json& document);

  // @throws InvalidConfiguration if the file cannot be read or is not JSON.
  static JsonMarketDataProvider fromFile(const std::string& path);

  std::optional<domain::MarketSnapshot> get(const std::string& symbol,
                                            Timestamp date) const override;

  std::vector<std::string> symbols() const;
  std::size_t barCount() const { return bar_count_; }
  std::size_t skippedCount() const { return skipped_; }

 private:
  void load(const nlohmann::json& bar);

  // symbol → (day number since epoch → bar)
  std::map<std::string, std::map<std::int64_t, domain::MarketSnapshot>> bars_;
  std::size_t bar_count_{0};
  std::size_t skipped_{0};
};

}  // namespace backtest
