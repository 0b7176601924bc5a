#include "backtest/config/config_loader.hpp"

#include "backtest/error/errors.hpp"
#include "backtest/time/time_utils.hpp"

#include <fstream>

namespace backtest {

namespace {

using nlohmann::json;

// Returns the named group, or an empty object when absent.
json group(const json& document, const char* key) {
  if (!document.contains(key)) {
    return json::object();
  }
  const json& node = document.at(key);
  if (!node.is_object()) {
    throw InvalidConfiguration(std::string("\"") + key +
                               "\" must be an object");
  }
  return node;
}

template <typename T>
void read(const json& node, const char* key, T& field) {
  field = node.value(key, field);
}

void read_position(const json& node, PositionConfig& cfg) {
  read(node, "commission_rate", cfg.commission_rate);
  read(node, "slippage_rate", cfg.slippage_rate);
  read(node, "default_position_pct", cfg.default_position_pct);
  read(node, "min_position_pct", cfg.min_position_pct);
  read(node, "max_position_pct", cfg.max_position_pct);
  read(node, "cash_buffer_ratio", cfg.cash_buffer_ratio);
  read(node, "min_trade_value", cfg.min_trade_value);
  read(node, "stop_loss_pct", cfg.stop_loss_pct);
  read(node, "take_profit_pct", cfg.take_profit_pct);
  read(node, "max_positions", cfg.max_positions);
  read(node, "max_holding_days", cfg.max_holding_days);
  read(node, "high_confidence_threshold", cfg.high_confidence_threshold);
  read(node, "medium_confidence_threshold", cfg.medium_confidence_threshold);
  read(node, "high_confidence_multiplier", cfg.high_confidence_multiplier);
  read(node, "medium_confidence_multiplier", cfg.medium_confidence_multiplier);
  read(node, "low_confidence_multiplier", cfg.low_confidence_multiplier);
  read(node, "transaction_history_capacity", cfg.transaction_history_capacity);
  read(node, "closed_positions_capacity", cfg.closed_positions_capacity);
  read(node, "snapshot_history_capacity", cfg.snapshot_history_capacity);
}

void read_risk(const json& node, RiskAnalysisConfig& cfg) {
  read(node, "lookback_days", cfg.lookback_days);
  read(node, "correlation_window", cfg.correlation_window);
  read(node, "gap_threshold", cfg.gap_threshold);
  read(node, "var_confidence", cfg.var_confidence);
  read(node, "slippage_multiplier", cfg.slippage_multiplier);
  read(node, "gap_sensitivity", cfg.gap_sensitivity);
  read(node, "correlation_sensitivity", cfg.correlation_sensitivity);
  read(node, "expected_slippage_weight", cfg.expected_slippage_weight);
  read(node, "min_gap_factor", cfg.min_gap_factor);
  read(node, "min_correlation_factor", cfg.min_correlation_factor);
  read(node, "max_diversification_bonus", cfg.max_diversification_bonus);
  read(node, "min_total_adjustment", cfg.min_total_adjustment);
  read(node, "concentration_score_weight", cfg.concentration_score_weight);
  read(node, "high_risk_threshold", cfg.high_risk_threshold);
  read(node, "moderate_risk_threshold", cfg.moderate_risk_threshold);
  read(node, "large_gap_threshold", cfg.large_gap_threshold);
  read(node, "frequent_gap_threshold", cfg.frequent_gap_threshold);
  read(node, "high_correlation_threshold", cfg.high_correlation_threshold);
  read(node, "extreme_correlation_threshold",
       cfg.extreme_correlation_threshold);
  read(node, "low_diversification_threshold",
       cfg.low_diversification_threshold);
}

void read_retry(const json& node, RetryConfig& cfg) {
  read(node, "max_attempts", cfg.max_attempts);
  read(node, "base_delay_ms", cfg.base_delay_ms);
  read(node, "max_delay_ms", cfg.max_delay_ms);
  read(node, "call_timeout_ms", cfg.call_timeout_ms);
  read(node, "call_deadline_ms", cfg.call_deadline_ms);
  read(node, "failure_threshold", cfg.failure_threshold);
  read(node, "cooldown_ms", cfg.cooldown_ms);
  read(node, "max_in_flight_attempts", cfg.max_in_flight_attempts);
}

void read_orchestrator(const json& node, OrchestratorConfig& cfg) {
  read(node, "min_confidence", cfg.min_confidence);
  read(node, "degraded_confidence", cfg.degraded_confidence);
  read(node, "aggressive_multiplier", cfg.aggressive_multiplier);
  read(node, "neutral_multiplier", cfg.neutral_multiplier);
  read(node, "conservative_multiplier", cfg.conservative_multiplier);
  read(node, "aggressive_stop_loss", cfg.aggressive_stop_loss);
  read(node, "aggressive_take_profit", cfg.aggressive_take_profit);
  read(node, "conservative_stop_loss", cfg.conservative_stop_loss);
  read(node, "conservative_take_profit", cfg.conservative_take_profit);
  read(node, "max_debate_rounds", cfg.max_debate_rounds);
  read(node, "max_risk_discuss_rounds", cfg.max_risk_discuss_rounds);
  read(node, "price_history_capacity", cfg.price_history_capacity);
  read(node, "agent_memory_capacity", cfg.agent_memory_capacity);
}

}  // namespace

BacktestConfig ConfigLoader::fromJson(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw InvalidConfiguration("configuration must be a JSON object");
  }

  BacktestConfig config;
  try {
    config.symbols = document.at("symbols").get<std::vector<std::string>>();
    config.start_date = parse_date(document.at("start_date").get<std::string>());
    config.end_date = parse_date(document.at("end_date").get<std::string>());

    read(document, "initial_capital", config.initial_capital);
    read(document, "symbol_concurrency", config.symbol_concurrency);
    read(document, "debug", config.debug);
    config.run_id = document.value(
        "run_id", "backtest-" + format_date(config.start_date) + "-" +
                      format_date(config.end_date));
    config.market_data_path = document.value("market_data", std::string());
    config.audit_log_path = document.value("audit_log", std::string());

    read_position(group(document, "position"), config.position);
    read_risk(group(document, "risk"), config.risk);
    read_retry(group(document, "retry"), config.retry);
    read_orchestrator(group(document, "orchestrator"), config.orchestrator);

    const json cache = group(document, "cache");
    read(cache, "enabled", config.cache.enabled);
    read(cache, "capacity", config.cache.capacity);
    read(cache, "ttl_ms", config.cache.ttl_ms);

    const json ipc = group(document, "ipc");
    read(ipc, "cmd_endpoint", config.ipc.cmd_endpoint);
    read(ipc, "pub_endpoint", config.ipc.pub_endpoint);
  } catch (const nlohmann::json::exception& e) {
    throw InvalidConfiguration(std::string("configuration error: ") +
                               e.what());
  }

  validate(config);
  return config;
}

BacktestConfig ConfigLoader::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw InvalidConfiguration("cannot open configuration file '" + path +
                               "'");
  }
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& e) {
    throw InvalidConfiguration("configuration file '" + path +
                               "' is not valid JSON: " + e.what());
  }
  return fromJson(document);
}

}  // namespace backtest
