#pragma once

#include "backtest/domain/position.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// PortfolioState: immutable snapshot handed out by PositionManager
// -----------------------------------------------------------------------------
//
// @brief  Cash, open positions and the total value computed from them.
//
// @details
// total_value is always cash + Σ quantity × last_price at the moment the
// snapshot was taken; nothing ever writes it independently. Positions are
// keyed by symbol, so a symbol appears at most once.
// -----------------------------------------------------------------------------
struct PortfolioState {
  double cash{0.0};
  std::map<std::string, Position> positions;
  double total_value{0.0};
  Timestamp timestamp{};

  double positionsValue() const {
    double value = 0.0;
    for (const auto& [symbol, pos] : positions) {
      value += pos.marketValue(pos.last_price);
    }
    return value;
  }

  const Position* find(const std::string& symbol) const {
    auto it = positions.find(symbol);
    return it != positions.end() ? &it->second : nullptr;
  }
};

// One point of the daily equity curve.
struct PortfolioSnapshot {
  Timestamp date{};
  double cash{0.0};
  double positions_value{0.0};
  double total_value{0.0};
  std::size_t open_positions{0};
};

}  // namespace domain
}  // namespace backtest
