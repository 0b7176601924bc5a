#pragma once

#include "backtest/domain/trade_action.hpp"
#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// Transaction: one committed fill
// -----------------------------------------------------------------------------
// Appended to the PositionManager's transaction history only after the whole
// portfolio mutation has committed. total_cost is cash out for a BUY
// (gross + commission + slippage) and cash in for a SELL
// (gross - commission - slippage).
// -----------------------------------------------------------------------------
struct Transaction {
  std::uint64_t id{0};
  Timestamp timestamp{};
  std::string symbol;
  TradeAction action{TradeAction::Hold};
  double quantity{0.0};
  double fill_price{0.0};
  double commission{0.0};
  double slippage{0.0};
  double total_cost{0.0};
  double realized_pnl{0.0};  // SELL only
  std::string decision_id;
};

// -----------------------------------------------------------------------------
// TransactionStatus / TransactionResult
// -----------------------------------------------------------------------------
// Business-rule outcomes of PositionManager::executeTransaction(). These are
// expected results of a simulation and are returned, not thrown.
// -----------------------------------------------------------------------------
enum class TransactionStatus {
  Committed,
  InsufficientFunds,
  InsufficientPosition,
  Invalid
};

const char* to_string(TransactionStatus status);

struct TransactionResult {
  TransactionStatus status{TransactionStatus::Invalid};
  Transaction transaction;  // Meaningful only when committed
  std::string reason;

  bool committed() const { return status == TransactionStatus::Committed; }
};

}  // namespace domain
}  // namespace backtest
