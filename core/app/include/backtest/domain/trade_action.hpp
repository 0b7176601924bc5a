#pragma once

#include <optional>
#include <string>

namespace backtest {
namespace domain {

// -----------------------------------------------------------------------------
// TradeAction / OrderKind / RiskStance
// -----------------------------------------------------------------------------
//
// @brief  Scoped enums shared by decisions, opinions and transactions.
//
// @details
// to_string() gives the canonical upper-case spelling used in JSON
// telemetry and audit records. The parse functions accept what providers
// actually send: case-insensitive, surrounding noise tolerated for actions
// ("STRONG BUY" → BUY). An action string containing both BUY and SELL is
// ambiguous and is rejected.
// -----------------------------------------------------------------------------
enum class TradeAction { Buy, Sell, Hold };

enum class OrderKind { Market, Limit };

enum class RiskStance { Aggressive, Neutral, Conservative };

const char* to_string(TradeAction action);
const char* to_string(OrderKind kind);
const char* to_string(RiskStance stance);

// Lenient: "buy", "Strong Buy", "BUY_SIGNAL" → Buy; "hold"/"neutral" → Hold.
std::optional<TradeAction> parse_trade_action(const std::string& text);

// Strict (case-insensitive): "aggressive" | "neutral" | "conservative".
std::optional<RiskStance> parse_risk_stance(const std::string& text);

}  // namespace domain
}  // namespace backtest
