#pragma once

#include "backtest/time/time_utils.hpp"

#include <map>
#include <string>
#include <vector>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// MarketSnapshot: one daily bar for one symbol
// -----------------------------------------------------------------------------
//
// @brief  OHLCV plus derived indicators, as handed over by the
//         IMarketDataProvider.
//
// @details
// Immutable once produced. The engine keeps a rolling window of these per
// symbol in MemoryStore; RiskAnalyzer reads gaps (open vs previous close)
// and close-to-close returns from that window.
//
// indicators holds whatever the provider derived ("rsi", "macd", ...). A
// std::map keeps key order stable, which matters because the snapshot is
// part of the ResultCache key.
// -----------------------------------------------------------------------------
struct MarketSnapshot {
  std::string symbol;
  Timestamp date{};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double volume{0.0};
  std::map<std::string, double> indicators;
  std::vector<double> news_sentiment;  // One score in [-1, 1] per article
};

}  // namespace domain
}  // namespace backtest
