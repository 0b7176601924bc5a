#include "backtest/portfolio/position_manager.hpp"

#include "backtest/error/errors.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <utility>

namespace backtest {

namespace {

// Fractional quantities: anything this small is treated as flat.
constexpr double kQuantityEpsilon = 1e-9;
constexpr double kValueTolerance = 1e-6;

domain::TransactionResult rejected(domain::TransactionStatus status,
                                   std::string reason) {
  domain::TransactionResult r;
  r.status = status;
  r.reason = std::move(reason);
  return r;
}

}  // namespace

PositionManager::PositionManager(PositionConfig config, double initial_capital,
                                 EventBus* bus)
    : config_(std::move(config)),
      initial_capital_(initial_capital),
      bus_(bus),
      cash_(initial_capital),
      transactions_(config_.transaction_history_capacity),
      closed_positions_(config_.closed_positions_capacity),
      snapshots_(config_.snapshot_history_capacity) {
  if (initial_capital <= 0.0) {
    throw InvalidConfiguration("initial_capital must be positive");
  }
}

// -----------------------------------------------------------------------------
// executeTransaction(): public entry, signal-driven trades
// -----------------------------------------------------------------------------
domain::TransactionResult PositionManager::executeTransaction(
    const domain::TradingDecision& decision, double fill_price) {
  domain::TransactionResult result;
  double cash_after = 0.0;
  {
    std::unique_lock lock(state_mutex_);
    result = commitLocked(decision, fill_price, domain::ExitReason::Signal);
    cash_after = cash_;
  }

  if (result.committed()) {
    publish(TransactionEvent{result.transaction, cash_after,
                             result.transaction.timestamp,
                             event_sequence_.next_id()});
  } else {
    std::cerr << "[PositionManager] " << domain::to_string(result.status)
              << " for " << decision.symbol << " ("
              << domain::to_string(decision.action) << "): " << result.reason
              << "\n";
  }
  return result;
}

// -----------------------------------------------------------------------------
// commitLocked(): validate and compute on locals, then write everything
// -----------------------------------------------------------------------------
domain::TransactionResult PositionManager::commitLocked(
    const domain::TradingDecision& decision, double fill_price,
    domain::ExitReason reason) {
  using domain::TradeAction;
  using domain::TransactionStatus;

  if (decision.action == TradeAction::Hold) {
    return rejected(TransactionStatus::Invalid, "HOLD is not executable");
  }
  if (!(fill_price > 0.0) || !std::isfinite(fill_price)) {
    return rejected(TransactionStatus::Invalid, "fill price must be positive");
  }
  if (!(decision.quantity > 0.0) || !std::isfinite(decision.quantity)) {
    return rejected(TransactionStatus::Invalid, "quantity must be positive");
  }

  const double qty = decision.quantity;
  const double gross = qty * fill_price;
  const double commission = gross * config_.commission_rate;
  const double slippage = gross * config_.slippage_rate;

  domain::Transaction tx;
  tx.timestamp = decision.timestamp;
  tx.symbol = decision.symbol;
  tx.action = decision.action;
  tx.quantity = qty;
  tx.fill_price = fill_price;
  tx.commission = commission;
  tx.slippage = slippage;
  tx.decision_id = decision.id;

  if (decision.action == TradeAction::Buy) {
    const double total_cost = gross + commission + slippage;
    if (total_cost > cash_) {
      return rejected(TransactionStatus::InsufficientFunds,
                      "total cost " + std::to_string(total_cost) +
                          " exceeds cash " + std::to_string(cash_));
    }

    auto it = positions_.find(decision.symbol);
    const bool opening = it == positions_.end();
    if (opening &&
        positions_.size() >= static_cast<std::size_t>(config_.max_positions)) {
      return rejected(TransactionStatus::Invalid,
                      "max_positions reached (" +
                          std::to_string(config_.max_positions) + ")");
    }

    domain::Position updated;
    if (opening) {
      updated.symbol = decision.symbol;
      updated.quantity = qty;
      updated.entry_price = fill_price;
      updated.entry_date = decision.timestamp;
      updated.stop_loss_pct = decision.stop_loss_pct > 0.0
                                  ? decision.stop_loss_pct
                                  : config_.stop_loss_pct;
      updated.take_profit_pct = decision.take_profit_pct > 0.0
                                    ? decision.take_profit_pct
                                    : config_.take_profit_pct;
    } else {
      updated = it->second;
      const double new_qty = updated.quantity + qty;
      updated.entry_price =
          (updated.quantity * updated.entry_price + qty * fill_price) / new_qty;
      updated.quantity = new_qty;
    }
    updated.last_price = fill_price;

    tx.total_cost = total_cost;
    tx.id = transaction_ids_.next_id();

    // Commit.
    cash_ -= total_cost;
    buy_costs_ += commission + slippage;
    positions_[decision.symbol] = updated;
    transactions_.append(tx);
    last_update_ = decision.timestamp;

    domain::TransactionResult ok;
    ok.status = TransactionStatus::Committed;
    ok.transaction = tx;
    return ok;
  }

  // SELL
  auto it = positions_.find(decision.symbol);
  const double held = it == positions_.end() ? 0.0 : it->second.quantity;
  if (it == positions_.end() || qty > held + kQuantityEpsilon) {
    return rejected(TransactionStatus::InsufficientPosition,
                    "sell quantity " + std::to_string(qty) + " exceeds held " +
                        std::to_string(held));
  }

  domain::Position updated = it->second;
  const double proceeds = gross - commission - slippage;
  const double realized = proceeds - qty * updated.entry_price;
  const double remaining = updated.quantity - qty;

  tx.total_cost = proceeds;
  tx.realized_pnl = realized;
  tx.id = transaction_ids_.next_id();

  // Commit.
  cash_ += proceeds;
  realized_pnl_ += realized;
  if (remaining <= kQuantityEpsilon) {
    domain::ClosedPosition closed;
    closed.symbol = updated.symbol;
    closed.quantity = qty;
    closed.entry_price = updated.entry_price;
    closed.entry_date = updated.entry_date;
    closed.exit_price = fill_price;
    closed.exit_date = decision.timestamp;
    closed.realized_pnl = updated.realized_pnl + realized;
    closed.reason = reason;
    positions_.erase(it);
    closed_positions_.append(closed);
  } else {
    updated.quantity = remaining;
    updated.realized_pnl += realized;
    updated.last_price = fill_price;
    it->second = updated;
  }
  transactions_.append(tx);
  last_update_ = decision.timestamp;

  domain::TransactionResult ok;
  ok.status = TransactionStatus::Committed;
  ok.transaction = tx;
  return ok;
}

double PositionManager::confidenceMultiplier(double confidence) const {
  if (confidence >= config_.high_confidence_threshold) {
    return config_.high_confidence_multiplier;
  }
  if (confidence >= config_.medium_confidence_threshold) {
    return config_.medium_confidence_multiplier;
  }
  return config_.low_confidence_multiplier;
}

// -----------------------------------------------------------------------------
// sizeFor()
// -----------------------------------------------------------------------------
double PositionManager::sizeFor(const domain::TradingDecision& decision,
                                double price,
                                const domain::PortfolioState& state,
                                const domain::RiskAssessment& assessment) const {
  using domain::TradeAction;

  if (decision.action == TradeAction::Hold || !(price > 0.0)) {
    return 0.0;
  }

  if (decision.action == TradeAction::Sell) {
    const domain::Position* held = state.find(decision.symbol);
    return held ? held->quantity : 0.0;
  }

  const bool opening = state.find(decision.symbol) == nullptr;
  if (opening && state.positions.size() >=
                     static_cast<std::size_t>(config_.max_positions)) {
    return 0.0;
  }

  const double base_pct = decision.position_size_pct > 0.0
                              ? decision.position_size_pct
                              : config_.default_position_pct;
  const double pct =
      std::clamp(base_pct * confidenceMultiplier(decision.confidence) *
                     assessment.size_adjustment,
                 config_.min_position_pct, config_.max_position_pct);

  double notional = pct * state.total_value;
  const double cost_factor =
      1.0 + config_.commission_rate + config_.slippage_rate;
  const double affordable = state.cash * config_.cash_buffer_ratio / cost_factor;
  if (notional > affordable) {
    notional = affordable;
  }

  if (notional < config_.min_position_pct * state.total_value ||
      notional < config_.min_trade_value || notional <= 0.0) {
    return 0.0;
  }
  return notional / price;
}

void PositionManager::markToMarket(const std::map<std::string, double>& prices) {
  std::unique_lock lock(state_mutex_);
  for (auto& [symbol, pos] : positions_) {
    auto it = prices.find(symbol);
    if (it != prices.end() && it->second > 0.0) {
      pos.last_price = it->second;
    }
  }
}

// -----------------------------------------------------------------------------
// checkExits(): stop loss, then take profit, then max holding period
// -----------------------------------------------------------------------------
std::vector<domain::TransactionResult> PositionManager::checkExits(
    const std::map<std::string, double>& prices, Timestamp date) {
  std::vector<domain::TransactionResult> results;
  std::vector<TransactionEvent> events;
  {
    std::unique_lock lock(state_mutex_);

    std::vector<std::pair<domain::TradingDecision, domain::ExitReason>> exits;
    for (const auto& [symbol, pos] : positions_) {
      auto it = prices.find(symbol);
      if (it == prices.end() || !(it->second > 0.0)) {
        continue;
      }
      const double price = it->second;
      const double ret = pos.unrealizedReturn(price);

      std::optional<domain::ExitReason> reason;
      if (ret <= -pos.stop_loss_pct) {
        reason = domain::ExitReason::StopLoss;
      } else if (ret >= pos.take_profit_pct) {
        reason = domain::ExitReason::TakeProfit;
      } else if (days_between(pos.entry_date, date) >=
                 config_.max_holding_days) {
        reason = domain::ExitReason::MaxHolding;
      }
      if (!reason) {
        continue;
      }

      domain::TradingDecision forced;
      forced.id = std::string("exit-") + domain::to_string(*reason) + "-" +
                symbol + "-" + format_date(date);
      forced.timestamp = date;
      forced.action = domain::TradeAction::Sell;
      forced.symbol = symbol;
      forced.quantity = pos.quantity;
      forced.confidence = 1.0;
      forced.rationale = std::string("forced exit: ") + domain::to_string(*reason);
      exits.emplace_back(std::move(forced), *reason);
    }

    for (const auto& [forced, reason] : exits) {
      domain::TransactionResult r =
          commitLocked(forced, prices.at(forced.symbol), reason);
      if (r.committed()) {
        events.push_back(TransactionEvent{r.transaction, cash_, date,
                                          event_sequence_.next_id()});
        std::cout << "[PositionManager] " << domain::to_string(reason)
                  << " exit " << forced.symbol << " qty=" << forced.quantity
                  << " pnl=" << r.transaction.realized_pnl << "\n";
      }
      results.push_back(std::move(r));
    }
  }

  for (const auto& e : events) {
    publish(e);
  }
  return results;
}

domain::PortfolioSnapshot PositionManager::recordSnapshot(Timestamp date) {
  domain::PortfolioSnapshot snap;
  {
    std::unique_lock lock(state_mutex_);
    const domain::PortfolioState state = snapshotLocked();
    snap.date = date;
    snap.cash = state.cash;
    snap.positions_value = state.positionsValue();
    snap.total_value = state.total_value;
    snap.open_positions = state.positions.size();
    snapshots_.append(snap);
  }
  publish(PortfolioUpdateEvent{snap, date, event_sequence_.next_id()});
  return snap;
}

domain::PortfolioState PositionManager::snapshot() const {
  std::shared_lock lock(state_mutex_);
  return snapshotLocked();
}

domain::PortfolioState PositionManager::snapshotLocked() const {
  domain::PortfolioState state;
  state.cash = cash_;
  state.positions = positions_;
  state.timestamp = last_update_;
  state.total_value = cash_ + state.positionsValue();
  return state;
}

std::optional<std::string> PositionManager::checkInvariants() const {
  std::shared_lock lock(state_mutex_);
  if (cash_ < -kValueTolerance) {
    return "cash is negative: " + std::to_string(cash_);
  }
  double unrealized = 0.0;
  for (const auto& [symbol, pos] : positions_) {
    if (!(pos.quantity > 0.0)) {
      return "position " + symbol + " has non-positive quantity";
    }
    if (pos.symbol != symbol) {
      return "position keyed " + symbol + " names " + pos.symbol;
    }
    unrealized += pos.quantity * (pos.last_price - pos.entry_price);
  }
  const double total = snapshotLocked().total_value;
  const double expected =
      initial_capital_ - buy_costs_ + realized_pnl_ + unrealized;
  if (std::abs(total - expected) >
      kValueTolerance * std::max(1.0, std::abs(total))) {
    return "total value " + std::to_string(total) +
           " != capital - costs + realized + unrealized " +
           std::to_string(expected);
  }
  return std::nullopt;
}

std::vector<domain::Transaction> PositionManager::transactions() const {
  std::shared_lock lock(state_mutex_);
  return transactions_.all();
}

std::vector<domain::ClosedPosition> PositionManager::closedPositions() const {
  std::shared_lock lock(state_mutex_);
  return closed_positions_.all();
}

std::vector<domain::PortfolioSnapshot> PositionManager::equityCurve() const {
  std::shared_lock lock(state_mutex_);
  return snapshots_.all();
}

double PositionManager::cash() const {
  std::shared_lock lock(state_mutex_);
  return cash_;
}

double PositionManager::realizedPnl() const {
  std::shared_lock lock(state_mutex_);
  return realized_pnl_;
}

double PositionManager::buyCosts() const {
  std::shared_lock lock(state_mutex_);
  return buy_costs_;
}

void PositionManager::publish(const Event& event) {
  if (bus_ != nullptr) {
    bus_->publish(event);
  }
}

}  // namespace backtest
