#include "backtest/domain/trade_action.hpp"

#include <algorithm>
#include <cctype>

namespace backtest {
namespace domain {

namespace {

std::string to_upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return text;
}

}  // namespace

const char* to_string(TradeAction action) {
  switch (action) {
    case TradeAction::Buy:  return "BUY";
    case TradeAction::Sell: return "SELL";
    case TradeAction::Hold: return "HOLD";
  }
  return "UNKNOWN";
}

const char* to_string(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market: return "MARKET";
    case OrderKind::Limit:  return "LIMIT";
  }
  return "UNKNOWN";
}

const char* to_string(RiskStance stance) {
  switch (stance) {
    case RiskStance::Aggressive:   return "AGGRESSIVE";
    case RiskStance::Neutral:      return "NEUTRAL";
    case RiskStance::Conservative: return "CONSERVATIVE";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// parse_trade_action(): substring match on the upper-cased text
// -----------------------------------------------------------------------------
std::optional<TradeAction> parse_trade_action(const std::string& text) {
  const std::string upper = to_upper(text);
  const bool has_buy = upper.find("BUY") != std::string::npos;
  const bool has_sell = upper.find("SELL") != std::string::npos;

  if (has_buy && has_sell) {
    return std::nullopt;
  }
  if (has_buy) {
    return TradeAction::Buy;
  }
  if (has_sell) {
    return TradeAction::Sell;
  }
  if (upper.find("HOLD") != std::string::npos ||
      upper.find("NEUTRAL") != std::string::npos) {
    return TradeAction::Hold;
  }
  return std::nullopt;
}

std::optional<RiskStance> parse_risk_stance(const std::string& text) {
  const std::string upper = to_upper(text);
  if (upper == "AGGRESSIVE") {
    return RiskStance::Aggressive;
  }
  if (upper == "NEUTRAL") {
    return RiskStance::Neutral;
  }
  if (upper == "CONSERVATIVE") {
    return RiskStance::Conservative;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace backtest
