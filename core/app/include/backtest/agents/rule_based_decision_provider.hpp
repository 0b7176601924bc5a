#pragma once

#include "backtest/agents/i_decision_provider.hpp"

#include <nlohmann/json.hpp>

namespace backtest {

// -----------------------------------------------------------------------------
// RuleBasedDecisionProvider: deterministic stand-in for the agent backend
// -----------------------------------------------------------------------------
//
// @brief  Answers every role from the context alone with fixed rules, so a
//         backtest is reproducible without any external service.
//
// @details
// Reads the context layout built by DecisionOrchestrator:
//
//   market.indicators   rsi, macd, sentiment, pe_ratio, revenue_growth,
//                       debt_to_equity (all optional)
//   market.news_sentiment, market.close, history.closes
//   analysts.<role>     { content, confidence, degraded }   (phases 3, 4)
//   research            { action, conviction, bull, bear }  (phase 4)
//   risk                { risk_score, ... }                 (phase 4)
//   portfolio.exposure
//
// Analysts:
//   technical     RSI (indicator, else 14-bar RSI of history), MACD
//                 (indicator, else SMA5 - SMA20), trend from close vs the
//                 history mean (±1%). RSI < 30 or bullish trend with
//                 MACD > 0 → BUY; RSI > 70 or bearish trend with MACD < 0 →
//                 SELL.
//   sentiment     "sentiment" indicator, else 5-bar return * 5, clamped.
//   news          mean of the article scores.
//   fundamentals  P/E < 15 undervalued, > 30 overvalued.
// Researchers count supporting points (max 5) from the analysts; confidence
// is min(0.9, 0.5 + 0.1 * points). The bear recommends SELL only with more
// than two points, HOLD otherwise.
// Risk debaters:
//   aggressive    0.8 when the provisional action is BUY, else 0.6.
//   conservative  0.8 when exposure > 0.5 or risk score > 50, else 0.7.
//   neutral       0.7.
//
// Thread model: stateless; generate() is safe from any thread.
// -----------------------------------------------------------------------------
class RuleBasedDecisionProvider : public IDecisionProvider {
 public:
  ProviderResponse generate(domain::AgentRole role,
                            const nlohmann::json& context) override;

 private:
  static ProviderResponse technical(const nlohmann::json& context);
  static ProviderResponse sentiment(const nlohmann::json& context);
  static ProviderResponse news(const nlohmann::json& context);
  static ProviderResponse fundamentals(const nlohmann::json& context);
  static ProviderResponse bull(const nlohmann::json& context);
  static ProviderResponse bear(const nlohmann::json& context);
  static ProviderResponse stance(domain::AgentRole role,
                                 const nlohmann::json& context);
};

}  // namespace backtest
