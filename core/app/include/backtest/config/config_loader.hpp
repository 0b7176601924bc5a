#pragma once

#include "backtest/config/backtest_config.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace backtest {

// -----------------------------------------------------------------------------
// ConfigLoader: BacktestConfig from JSON
// -----------------------------------------------------------------------------
//
// @brief  Reads a run configuration and validates it.
//
// @details
// Layout (only symbols, start_date and end_date are required):
//
//   {
//     "run_id": "nightly", "symbols": ["AAPL", "MSFT"],
//     "start_date": "2024-01-02", "end_date": "2024-03-29",
//     "initial_capital": 100000, "symbol_concurrency": 2, "debug": false,
//     "market_data": "bars.json", "audit_log": "audit.jsonl",
//     "position":     { "commission_rate": 0.001, "max_positions": 10, ... },
//     "risk":         { "gap_threshold": 0.02, "var_confidence": 0.95, ... },
//     "cache":        { "enabled": true, "capacity": 1000, "ttl_ms": ... },
//     "retry":        { "max_attempts": 3, "failure_threshold": 5, ... },
//     "orchestrator": { "min_confidence": 0.3, ... },
//     "ipc":          { "cmd_endpoint": "tcp://127.0.0.1:5556",
//                       "pub_endpoint": "tcp://127.0.0.1:5557" }
//   }
//
// Group keys carry the same names as the struct fields. Optional keys are
// read with json::value() so an absent key keeps its default; required
// keys use json::at(). Any JSON type or parse error, an unknown date, or a
// failed validate() is reported as InvalidConfiguration.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static BacktestConfig fromJson(const nlohmann::json& document);
  static BacktestConfig fromFile(const std::string& path);
};

}  // namespace backtest
