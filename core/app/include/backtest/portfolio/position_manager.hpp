#pragma once

#include "backtest/concurrent/bounded_history.hpp"
#include "backtest/concurrent/sequence_generator.hpp"
#include "backtest/config/backtest_config.hpp"
#include "backtest/domain/portfolio_state.hpp"
#include "backtest/domain/position.hpp"
#include "backtest/domain/trading_decision.hpp"
#include "backtest/domain/transaction.hpp"
#include "backtest/eventbus/event_bus.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// PositionManager: sole owner of the simulated portfolio
// -----------------------------------------------------------------------------
//
// @brief  Sizes orders, executes them atomically against cash and positions,
//         values the portfolio and fires exit rules.
//
// @details
// Every mutation goes through one private commit path guarded by a
// unique_lock on state_mutex_. A transaction is validated and fully
// computed on local copies before anything is written, so either cash,
// positions, transaction history and closed-position history all change,
// or none of them do.
//
// Costs (fractions of gross notional = quantity * price):
//   BUY   total_cost = gross + commission + slippage   (cash out)
//   SELL  total_cost = gross - commission - slippage   (cash in)
//         realized   = total_cost - quantity * entry_price
// The fill price recorded is the raw price; slippage is carried as a cost.
//
// Invariants after every committed transaction:
//   cash >= 0
//   total_value == cash + Σ quantity * last_price
// total_value is never stored; PortfolioState snapshots compute it.
//
// Thread model:
//   Writers (executeTransaction, checkExits, markToMarket, recordSnapshot)
//   take the unique lock; readers (snapshot, histories, sizeFor on a
//   snapshot) take a shared lock. SimulationEngine additionally serializes
//   all writers so decision order is deterministic.
//   Events are published after the lock is released.
//
// Ownership:
//   Owned by SimulationEngine via std::unique_ptr. Holds a non-owning
//   pointer to the engine's EventBus (may be null in tests).
// -----------------------------------------------------------------------------
class PositionManager {
 public:
  PositionManager(PositionConfig config, double initial_capital,
                  EventBus* bus = nullptr);

  PositionManager(const PositionManager&) = delete;
  PositionManager& operator=(const PositionManager&) = delete;
  PositionManager(PositionManager&&) = delete;
  PositionManager& operator=(PositionManager&&) = delete;

  // -------------------------------------------------------------------------
  // executeTransaction(decision, fill_price)
  // -------------------------------------------------------------------------
  //
  // @brief  Applies a sized BUY or SELL at fill_price, all or nothing.
  //
  // @param  decision    Must carry action BUY/SELL and quantity > 0. Its
  //                     timestamp becomes the transaction time; its stop /
  //                     take levels are attached to a newly opened position.
  // @param  fill_price  Simulated execution price, > 0.
  //
  // @return Committed with the recorded Transaction, or
  //         InsufficientFunds / InsufficientPosition / Invalid with a reason
  //         and the portfolio untouched.
  //
  // Side-effects: On commit publishes TransactionEvent.
  // -------------------------------------------------------------------------
  domain::TransactionResult executeTransaction(
      const domain::TradingDecision& decision, double fill_price);

  // -------------------------------------------------------------------------
  // sizeFor(decision, price, state, assessment)
  // -------------------------------------------------------------------------
  //
  // @brief  Quantity to trade for a decision whose quantity is 0.
  //
  // @details
  // BUY:  pct = decision.position_size_pct (config default when 0)
  //           * confidence multiplier * assessment.size_adjustment,
  //       clamped to [min_position_pct, max_position_pct];
  //       notional = pct * total_value, capped by what cash can pay
  //       (cash * cash_buffer_ratio incl. costs).
  //       Returns 0 when the capped notional falls below min_position_pct
  //       of total value or below min_trade_value, or when opening a new
  //       symbol would exceed max_positions.
  // SELL: the full held quantity (0 when nothing is held).
  // HOLD: 0.
  //
  // A non-zero BUY result therefore always lies within
  // [min_position_pct, max_position_pct] of total value.
  // -------------------------------------------------------------------------
  double sizeFor(const domain::TradingDecision& decision, double price,
                 const domain::PortfolioState& state,
                 const domain::RiskAssessment& assessment) const;

  double confidenceMultiplier(double confidence) const;

  // Updates last prices for held symbols present in `prices`.
  void markToMarket(const std::map<std::string, double>& prices);

  // -------------------------------------------------------------------------
  // checkExits(prices, date)
  // -------------------------------------------------------------------------
  //
  // @brief  Forces a full SELL of every position that breached its stop
  //         loss, its take profit, or the maximum holding period.
  //
  // @return One result per forced exit, in symbol order.
  // -------------------------------------------------------------------------
  std::vector<domain::TransactionResult> checkExits(
      const std::map<std::string, double>& prices, Timestamp date);

  // Appends today's equity point and publishes PortfolioUpdateEvent.
  domain::PortfolioSnapshot recordSnapshot(Timestamp date);

  domain::PortfolioState snapshot() const;

  // Describes the first violated invariant, or nullopt when all hold.
  //
  // Besides cash >= 0 and well-formed positions, total value must equal
  //   initial_capital - buy costs + realized P&L
  //     + sum(qty * (last_price - entry_price))
  // where buy costs (commission + slippage paid on BUYs) and realized P&L
  // are ledgers accumulated per commit, independently of cash.
  std::optional<std::string> checkInvariants() const;

  std::vector<domain::Transaction> transactions() const;
  std::vector<domain::ClosedPosition> closedPositions() const;
  std::vector<domain::PortfolioSnapshot> equityCurve() const;

  double cash() const;
  double realizedPnl() const;
  double buyCosts() const;
  double initialCapital() const { return initial_capital_; }
  const PositionConfig& config() const { return config_; }

 private:
  domain::TransactionResult commitLocked(
      const domain::TradingDecision& decision, double fill_price,
      domain::ExitReason reason);
  domain::PortfolioState snapshotLocked() const;
  void publish(const Event& event);

  const PositionConfig config_;
  const double initial_capital_;
  EventBus* bus_;

  mutable std::shared_mutex state_mutex_;
  double cash_;
  double realized_pnl_{0.0};
  double buy_costs_{0.0};
  std::map<std::string, domain::Position> positions_;
  Timestamp last_update_{};

  BoundedHistory<domain::Transaction> transactions_;
  BoundedHistory<domain::ClosedPosition> closed_positions_;
  BoundedHistory<domain::PortfolioSnapshot> snapshots_;

  SequenceGenerator transaction_ids_;
  SequenceGenerator event_sequence_;
};

}  // namespace backtest
