#include "backtest/config/backtest_config.hpp"

#include "backtest/error/errors.hpp"

#include <set>
#include <string>

namespace backtest {

namespace {

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw InvalidConfiguration(message);
  }
}

bool in_range(double value, double lo, double hi) {
  return value >= lo && value <= hi;
}

}  // namespace

void validate(const BacktestConfig& config) {
  require(!config.symbols.empty(), "at least one symbol is required");
  std::set<std::string> unique;
  for (const auto& symbol : config.symbols) {
    require(!symbol.empty(), "symbol names must not be empty");
    require(unique.insert(symbol).second, "duplicate symbol: " + symbol);
  }

  require(config.start_date < config.end_date,
          "start_date must be before end_date (" +
              format_date(config.start_date) + " .. " +
              format_date(config.end_date) + ")");
  require(config.initial_capital > 0.0, "initial_capital must be positive");
  require(config.symbol_concurrency >= 1, "symbol_concurrency must be >= 1");

  const PositionConfig& pos = config.position;
  require(in_range(pos.commission_rate, 0.0, 0.1),
          "commission_rate must be in [0, 0.1]");
  require(in_range(pos.slippage_rate, 0.0, 0.1),
          "slippage_rate must be in [0, 0.1]");
  require(pos.min_position_pct > 0.0 &&
              pos.min_position_pct <= pos.max_position_pct &&
              pos.max_position_pct <= 1.0,
          "position bounds must satisfy 0 < min_position_pct <= "
          "max_position_pct <= 1");
  require(pos.default_position_pct > 0.0 && pos.default_position_pct <= 1.0,
          "default_position_pct must be in (0, 1]");
  require(pos.cash_buffer_ratio > 0.0 && pos.cash_buffer_ratio <= 1.0,
          "cash_buffer_ratio must be in (0, 1]");
  require(pos.min_trade_value >= 0.0, "min_trade_value must be >= 0");
  require(pos.stop_loss_pct > 0.0 && pos.stop_loss_pct <= 1.0,
          "stop_loss_pct must be in (0, 1]");
  require(pos.take_profit_pct > 0.0 && pos.take_profit_pct <= 1.0,
          "take_profit_pct must be in (0, 1]");
  require(pos.max_positions >= 1 && pos.max_positions <= 100,
          "max_positions must be in [1, 100]");
  require(pos.max_holding_days >= 1, "max_holding_days must be >= 1");
  require(pos.transaction_history_capacity > 0 &&
              pos.closed_positions_capacity > 0 &&
              pos.snapshot_history_capacity > 0,
          "history capacities must be positive");

  require(config.cache.capacity > 0, "cache capacity must be positive");
  require(config.cache.ttl_ms > 0, "cache ttl must be positive");

  const RetryConfig& retry = config.retry;
  require(retry.max_attempts >= 1, "retry max_attempts must be >= 1");
  require(retry.base_delay_ms >= 0 && retry.max_delay_ms >= retry.base_delay_ms,
          "retry delays must satisfy 0 <= base_delay_ms <= max_delay_ms");
  require(retry.call_timeout_ms > 0, "call_timeout_ms must be positive");
  require(retry.call_deadline_ms >= retry.call_timeout_ms,
          "call_deadline_ms must be >= call_timeout_ms");
  require(retry.failure_threshold >= 1, "failure_threshold must be >= 1");
  require(retry.cooldown_ms > 0, "cooldown_ms must be positive");
  require(retry.max_in_flight_attempts >= 1,
          "max_in_flight_attempts must be >= 1");

  const RiskAnalysisConfig& risk = config.risk;
  require(risk.var_confidence > 0.0 && risk.var_confidence < 1.0,
          "var_confidence must be in (0, 1)");
  require(risk.gap_threshold >= 0.0, "gap_threshold must be >= 0");
  require(risk.lookback_days >= 2, "lookback_days must be >= 2");
  require(risk.min_total_adjustment > 0.0 && risk.min_total_adjustment <= 1.0,
          "min_total_adjustment must be in (0, 1]");

  const OrchestratorConfig& orch = config.orchestrator;
  require(in_range(orch.min_confidence, 0.0, 1.0),
          "min_confidence must be in [0, 1]");
  require(orch.max_debate_rounds >= 1 && orch.max_debate_rounds <= 10,
          "max_debate_rounds must be in [1, 10]");
  require(orch.max_risk_discuss_rounds >= 1 &&
              orch.max_risk_discuss_rounds <= 10,
          "max_risk_discuss_rounds must be in [1, 10]");
  require(orch.price_history_capacity > 0 && orch.agent_memory_capacity > 0,
          "memory capacities must be positive");
}

}  // namespace backtest
