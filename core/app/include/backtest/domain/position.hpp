#pragma once

#include "backtest/time/time_utils.hpp"

#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// Position: one open long holding
// -----------------------------------------------------------------------------
//
// @brief  Quantity, averaged entry price and the exit levels the holding was
//         opened with.
//
// @details
// Long-only: quantity is always > 0 while the position exists; the
// PositionManager removes it from the portfolio the moment a SELL brings it
// to zero and archives a ClosedPosition instead.
//
// entry_price is the weighted average cost when a BUY adds to an existing
// holding. last_price is whatever the last valuation pass saw; unrealized
// P&L is never stored and is always computed from a price the caller
// supplies.
//
// realized_pnl accumulates partial sells that did not close the position.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double quantity{0.0};
  double entry_price{0.0};
  Timestamp entry_date{};
  double stop_loss_pct{0.0};
  double take_profit_pct{0.0};
  double last_price{0.0};
  double realized_pnl{0.0};

  double marketValue(double price) const { return quantity * price; }
  double unrealizedPnl(double price) const {
    return quantity * (price - entry_price);
  }
  double unrealizedReturn(double price) const {
    return entry_price > 0.0 ? (price - entry_price) / entry_price : 0.0;
  }
};

enum class ExitReason { Signal, StopLoss, TakeProfit, MaxHolding };

const char* to_string(ExitReason reason);

// Archived record of a fully closed position.
struct ClosedPosition {
  std::string symbol;
  double quantity{0.0};
  double entry_price{0.0};
  Timestamp entry_date{};
  double exit_price{0.0};
  Timestamp exit_date{};
  double realized_pnl{0.0};
  ExitReason reason{ExitReason::Signal};
};

}  // namespace domain
}  // namespace backtest
