#include "backtest/serialization/record_json.hpp"

#include "backtest/agents/opinion_parser.hpp"
#include "backtest/time/time_utils.hpp"

namespace backtest {

nlohmann::json toJson(const domain::MarketSnapshot& snapshot) {
  nlohmann::json j;
  j["symbol"] = snapshot.symbol;
  j["date"] = format_date(snapshot.date);
  j["open"] = snapshot.open;
  j["high"] = snapshot.high;
  j["low"] = snapshot.low;
  j["close"] = snapshot.close;
  j["volume"] = snapshot.volume;
  j["indicators"] = snapshot.indicators;
  j["news_sentiment"] = snapshot.news_sentiment;
  return j;
}

nlohmann::json toJson(const domain::Position& position) {
  nlohmann::json j;
  j["symbol"] = position.symbol;
  j["quantity"] = position.quantity;
  j["entry_price"] = position.entry_price;
  j["entry_date"] = format_date(position.entry_date);
  j["stop_loss_pct"] = position.stop_loss_pct;
  j["take_profit_pct"] = position.take_profit_pct;
  j["last_price"] = position.last_price;
  j["unrealized_pnl"] = position.unrealizedPnl(position.last_price);
  j["realized_pnl"] = position.realized_pnl;
  return j;
}

nlohmann::json toJson(const domain::PortfolioState& state) {
  nlohmann::json j;
  j["cash"] = state.cash;
  j["total_value"] = state.total_value;
  j["timestamp"] = format_date(state.timestamp);
  j["positions"] = nlohmann::json::array();
  for (const auto& [symbol, position] : state.positions) {
    j["positions"].push_back(toJson(position));
  }
  return j;
}

nlohmann::json toJson(const domain::PortfolioSnapshot& snapshot) {
  nlohmann::json j;
  j["date"] = format_date(snapshot.date);
  j["cash"] = snapshot.cash;
  j["positions_value"] = snapshot.positions_value;
  j["total_value"] = snapshot.total_value;
  j["open_positions"] = snapshot.open_positions;
  return j;
}

nlohmann::json toJson(const domain::Transaction& transaction) {
  nlohmann::json j;
  j["id"] = transaction.id;
  j["timestamp"] = format_date(transaction.timestamp);
  j["symbol"] = transaction.symbol;
  j["action"] = domain::to_string(transaction.action);
  j["quantity"] = transaction.quantity;
  j["fill_price"] = transaction.fill_price;
  j["commission"] = transaction.commission;
  j["slippage"] = transaction.slippage;
  j["total_cost"] = transaction.total_cost;
  j["realized_pnl"] = transaction.realized_pnl;
  j["decision_id"] = transaction.decision_id;
  return j;
}

nlohmann::json toJson(const domain::RiskAssessment& assessment) {
  nlohmann::json j;
  j["stance"] = domain::to_string(assessment.stance);
  j["aggressive_score"] = assessment.aggressive_score;
  j["neutral_score"] = assessment.neutral_score;
  j["conservative_score"] = assessment.conservative_score;
  j["key_risks"] = assessment.key_risks;
  j["size_adjustment"] = assessment.size_adjustment;
  j["risk_score"] = assessment.risk_score;
  j["advisories"] = assessment.advisories;
  return j;
}

nlohmann::json toJson(const domain::EnhancedRiskMetrics& metrics) {
  nlohmann::json gap;
  gap["max_gap"] = metrics.gap.max_gap;
  gap["mean_gap"] = metrics.gap.mean_gap;
  gap["gap_frequency"] = metrics.gap.gap_frequency;
  gap["expected_slippage"] = metrics.gap.expected_slippage;
  gap["significant_days"] = metrics.gap.significant_days;
  gap["total_days"] = metrics.gap.total_days;

  nlohmann::json correlation;
  correlation["symbols"] = metrics.correlation.symbols;
  correlation["portfolio_correlation"] =
      metrics.correlation.portfolio_correlation;
  correlation["max_pair_correlation"] =
      metrics.correlation.max_pair_correlation;
  correlation["concentration"] = metrics.correlation.concentration;
  correlation["diversification_ratio"] =
      metrics.correlation.diversification_ratio;

  nlohmann::json j;
  j["gap"] = std::move(gap);
  j["correlation"] = std::move(correlation);
  j["value_at_risk"] = metrics.value_at_risk;
  j["risk_score"] = metrics.risk_score;
  j["size_adjustment"] = metrics.size_adjustment;
  j["recommendations"] = metrics.recommendations;
  return j;
}

nlohmann::json toJson(const domain::TradingDecision& decision,
                      bool with_opinions) {
  nlohmann::json j;
  j["id"] = decision.id;
  j["timestamp"] = format_date(decision.timestamp);
  j["symbol"] = decision.symbol;
  j["action"] = domain::to_string(decision.action);
  j["quantity"] = decision.quantity;
  j["order_kind"] = domain::to_string(decision.order_kind);
  j["confidence"] = decision.confidence;
  j["rationale"] = decision.rationale;
  j["position_size_pct"] = decision.position_size_pct;
  j["stop_loss_pct"] = decision.stop_loss_pct;
  j["take_profit_pct"] = decision.take_profit_pct;
  j["risk"] = toJson(decision.risk);
  if (with_opinions) {
    j["opinions"] = nlohmann::json::array();
    for (const auto& opinion : decision.opinions) {
      j["opinions"].push_back(OpinionParser::toJson(opinion));
    }
  }
  return j;
}

nlohmann::json toJson(const domain::DecisionRecord& record) {
  nlohmann::json j;
  j["decision"] = toJson(record.decision, false);
  j["outcome"] = domain::to_string(record.outcome);
  j["reason"] = record.reason;
  j["transaction"] =
      record.transaction ? toJson(*record.transaction) : nlohmann::json();
  j["risk_metrics"] = toJson(record.risk_metrics);
  return j;
}

nlohmann::json toJson(const domain::AuditRecord& record) {
  nlohmann::json j;
  j["decision"] = toJson(record.decision);
  j["transaction"] = toJson(record.transaction);
  j["stored_at_ms"] = timestamp_to_ms(record.stored_at);
  return j;
}

nlohmann::json toJson(const domain::ClosedPosition& closed) {
  nlohmann::json j;
  j["symbol"] = closed.symbol;
  j["quantity"] = closed.quantity;
  j["entry_price"] = closed.entry_price;
  j["entry_date"] = format_date(closed.entry_date);
  j["exit_price"] = closed.exit_price;
  j["exit_date"] = format_date(closed.exit_date);
  j["realized_pnl"] = closed.realized_pnl;
  j["reason"] = domain::to_string(closed.reason);
  return j;
}

nlohmann::json summaryJson(const domain::BacktestResult& result) {
  std::size_t filled = 0;
  std::size_t rejected = 0;
  std::size_t holds = 0;
  for (const auto& record : result.decisions) {
    switch (record.outcome) {
      case domain::ExecutionOutcome::Filled:   ++filled; break;
      case domain::ExecutionOutcome::Rejected: ++rejected; break;
      case domain::ExecutionOutcome::Hold:     ++holds; break;
      default: break;
    }
  }

  const double final_value = result.final_state.total_value;
  nlohmann::json j;
  j["run_id"] = result.run_id;
  j["cancelled"] = result.cancelled;
  j["trading_days"] = result.trading_days;
  j["initial_capital"] = result.initial_capital;
  j["final_value"] = final_value;
  j["return_pct"] = result.initial_capital > 0.0
                        ? (final_value / result.initial_capital - 1.0) * 100.0
                        : 0.0;
  j["cash"] = result.final_state.cash;
  j["open_positions"] = result.final_state.positions.size();
  j["decisions"] = result.decisions.size();
  j["filled"] = filled;
  j["rejected"] = rejected;
  j["holds"] = holds;
  j["transactions"] = result.transactions.size();
  j["closed_positions"] = result.closed_positions.size();
  j["elapsed_ms"] =
      timestamp_to_ms(result.finished_at) - timestamp_to_ms(result.started_at);
  return j;
}

}  // namespace backtest
