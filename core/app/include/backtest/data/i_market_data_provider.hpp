#pragma once

#include "backtest/domain/market_snapshot.hpp"
#include "backtest/time/time_utils.hpp"

#include <optional>
#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// IMarketDataProvider
// -----------------------------------------------------------------------------
//
// @brief  Read-only source of daily bars.
//
// @details
// get() returns std::nullopt when no bar exists for (symbol, date): a
// holiday, a halted symbol, or a date outside the data set. The engine
// treats that as "no decision for this symbol today", never as an error.
//
// Must be deterministic for a given (symbol, date) within one run and safe
// to call from several threads at once.
// -----------------------------------------------------------------------------
class IMarketDataProvider {
 public:
  virtual ~IMarketDataProvider() = default;

  virtual std::optional<domain::MarketSnapshot> get(const std::string& symbol,
                                                    Timestamp date) const = 0;
};

}  // namespace backtest
