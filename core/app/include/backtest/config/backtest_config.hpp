#pragma once

#include "backtest/time/time_utils.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// BacktestConfig: everything a run is parameterized by
// -----------------------------------------------------------------------------
//
// @brief  Plain data structs with in-class defaults, grouped by the component
//         that consumes them.
//
// @details
// Each component receives its own group by value at construction and never
// sees the rest. ConfigLoader fills these from JSON; keys that are absent
// keep the defaults below. validate() is the single place where ranges are
// enforced, and SimulationEngine calls it before touching any state.
//
// Durations are integer milliseconds throughout so they can be driven by
// either time provider.
// -----------------------------------------------------------------------------

struct RiskAnalysisConfig {
  int lookback_days{30};
  int correlation_window{60};

  double gap_threshold{0.02};
  double var_confidence{0.95};

  double slippage_multiplier{0.5};
  double gap_sensitivity{2.0};
  double correlation_sensitivity{0.5};
  double expected_slippage_weight{1.0};

  double min_gap_factor{0.5};
  double min_correlation_factor{0.7};
  double max_diversification_bonus{1.2};
  double min_total_adjustment{0.3};

  double concentration_score_weight{40.0};

  double high_risk_threshold{70.0};
  double moderate_risk_threshold{50.0};
  double large_gap_threshold{0.05};
  double frequent_gap_threshold{0.1};
  double high_correlation_threshold{0.7};
  double extreme_correlation_threshold{0.9};
  double low_diversification_threshold{1.2};
};

struct PositionConfig {
  double commission_rate{0.001};
  double slippage_rate{0.001};

  double default_position_pct{0.10};
  double min_position_pct{0.01};
  double max_position_pct{0.90};
  double cash_buffer_ratio{0.95};
  double min_trade_value{100.0};

  double stop_loss_pct{0.10};
  double take_profit_pct{0.20};
  int max_positions{10};
  int max_holding_days{30};

  double high_confidence_threshold{0.8};
  double medium_confidence_threshold{0.5};
  double high_confidence_multiplier{1.0};
  double medium_confidence_multiplier{0.7};
  double low_confidence_multiplier{0.4};

  long long transaction_history_capacity{50'000};
  long long closed_positions_capacity{10'000};
  long long snapshot_history_capacity{10'000};
};

struct CacheConfig {
  bool enabled{true};
  long long capacity{1'000};
  std::int64_t ttl_ms{3'600'000};
};

struct RetryConfig {
  int max_attempts{3};
  std::int64_t base_delay_ms{2'000};
  std::int64_t max_delay_ms{30'000};
  std::int64_t call_timeout_ms{300'000};
  std::int64_t call_deadline_ms{900'000};
  int failure_threshold{5};
  std::int64_t cooldown_ms{120'000};
  // Provider calls allowed to run at once, abandoned timed-out ones included.
  int max_in_flight_attempts{32};
};

struct OrchestratorConfig {
  double min_confidence{0.3};
  double degraded_confidence{0.1};

  double aggressive_multiplier{1.3};
  double neutral_multiplier{1.0};
  double conservative_multiplier{0.7};
  double aggressive_stop_loss{0.15};
  double aggressive_take_profit{0.30};
  double conservative_stop_loss{0.05};
  double conservative_take_profit{0.10};

  // Total passes of the bull/bear debate and of the stance discussion; each
  // pass after the first re-asks every side with the others' latest views.
  int max_debate_rounds{1};
  int max_risk_discuss_rounds{1};

  long long price_history_capacity{250};
  long long agent_memory_capacity{1'000};
};

struct IpcConfig {
  std::string cmd_endpoint;
  std::string pub_endpoint;
};

struct BacktestConfig {
  std::string run_id;
  std::vector<std::string> symbols;
  Timestamp start_date{};
  Timestamp end_date{};
  double initial_capital{10'000.0};
  int symbol_concurrency{1};
  bool debug{false};

  RiskAnalysisConfig risk;
  PositionConfig position;
  CacheConfig cache;
  RetryConfig retry;
  OrchestratorConfig orchestrator;
  IpcConfig ipc;

  // Used by the CLI only; the engine takes collaborators by interface.
  std::string market_data_path;
  std::string audit_log_path;
};

// -----------------------------------------------------------------------------
// validate(config)
// -----------------------------------------------------------------------------
//
// @brief  Throws InvalidConfiguration describing the first violated range.
//
// @details
// Checks symbols, date range, capital, commission/slippage, position bounds,
// history and cache capacities, retry and circuit tuning, stop/take levels
// and the VaR confidence. Pure; safe from any thread.
// -----------------------------------------------------------------------------
void validate(const BacktestConfig& config);

}  // namespace backtest
