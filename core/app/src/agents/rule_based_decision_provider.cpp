#include "backtest/agents/rule_based_decision_provider.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace backtest {

namespace {

using nlohmann::json;

const json& section(const json& parent, const char* key) {
  static const json empty = json::object();
  if (parent.is_object()) {
    auto it = parent.find(key);
    if (it != parent.end() && it->is_object()) {
      return *it;
    }
  }
  return empty;
}

std::vector<double> closes(const json& context) {
  const json& history = section(context, "history");
  auto it = history.find("closes");
  if (it == history.end() || !it->is_array()) {
    return {};
  }
  return it->get<std::vector<double>>();
}

double mean_of_last(const std::vector<double>& values, std::size_t n) {
  if (values.empty()) {
    return 0.0;
  }
  n = std::min(n, values.size());
  double sum = 0.0;
  for (std::size_t i = values.size() - n; i < values.size(); ++i) {
    sum += values[i];
  }
  return sum / static_cast<double>(n);
}

double rsi_of(const std::vector<double>& closes, std::size_t period) {
  if (closes.size() < 2) {
    return 50.0;
  }
  const std::size_t start =
      closes.size() > period + 1 ? closes.size() - period - 1 : 0;
  double gains = 0.0;
  double losses = 0.0;
  for (std::size_t i = start + 1; i < closes.size(); ++i) {
    const double diff = closes[i] - closes[i - 1];
    if (diff > 0) {
      gains += diff;
    } else {
      losses -= diff;
    }
  }
  if (losses == 0.0) {
    return gains > 0.0 ? 100.0 : 50.0;
  }
  const double rs = gains / losses;
  return 100.0 - 100.0 / (1.0 + rs);
}

// Content and confidence of an analyst opinion forwarded in the context.
const json& analyst(const json& context, const char* role) {
  return section(section(context, "analysts"), role);
}

const json& analyst_content(const json& context, const char* role) {
  return section(analyst(context, role), "content");
}

ProviderResponse respond(json payload, double confidence,
                         std::string rationale) {
  ProviderResponse response;
  response.payload = std::move(payload);
  response.confidence = confidence;
  response.rationale = std::move(rationale);
  return response;
}

}  // namespace

ProviderResponse RuleBasedDecisionProvider::generate(
    domain::AgentRole role, const nlohmann::json& context) {
  switch (role) {
    case domain::AgentRole::Technical:    return technical(context);
    case domain::AgentRole::Sentiment:    return sentiment(context);
    case domain::AgentRole::News:         return news(context);
    case domain::AgentRole::Fundamentals: return fundamentals(context);
    case domain::AgentRole::Bull:         return bull(context);
    case domain::AgentRole::Bear:         return bear(context);
    case domain::AgentRole::Aggressive:
    case domain::AgentRole::Conservative:
    case domain::AgentRole::Neutral:      return stance(role, context);
  }
  return respond(json::object(), 0.0, "unknown role");
}

ProviderResponse RuleBasedDecisionProvider::technical(const json& context) {
  const json& market = section(context, "market");
  const json& indicators = section(market, "indicators");
  const std::vector<double> history = closes(context);

  const double rsi = indicators.value("rsi", rsi_of(history, 14));
  const double macd = indicators.value(
      "macd", mean_of_last(history, 5) - mean_of_last(history, 20));
  const double close = market.value("close", 0.0);
  const double average = mean_of_last(history, history.size());

  std::string trend = "neutral";
  if (average > 0.0 && close > average * 1.01) {
    trend = "bullish";
  } else if (average > 0.0 && close < average * 0.99) {
    trend = "bearish";
  }

  std::string signal = "HOLD";
  if (rsi < 30.0 || (trend == "bullish" && macd > 0.0)) {
    signal = "BUY";
  } else if (rsi > 70.0 || (trend == "bearish" && macd < 0.0)) {
    signal = "SELL";
  }

  const double confidence = signal == "HOLD" ? 0.5 : 0.7;
  json payload = {{"signal", signal},
                  {"trend", trend},
                  {"rsi", std::clamp(rsi, 0.0, 100.0)},
                  {"macd", macd}};
  return respond(std::move(payload), confidence,
                 "RSI " + std::to_string(static_cast<int>(rsi)) + ", trend " +
                     trend);
}

ProviderResponse RuleBasedDecisionProvider::sentiment(const json& context) {
  const json& indicators = section(section(context, "market"), "indicators");
  double score = 0.0;
  if (indicators.contains("sentiment")) {
    score = indicators.at("sentiment").get<double>();
  } else {
    const std::vector<double> history = closes(context);
    if (history.size() >= 6 && history[history.size() - 6] > 0.0) {
      const double ret =
          history.back() / history[history.size() - 6] - 1.0;
      score = ret * 5.0;
    }
  }
  score = std::clamp(score, -1.0, 1.0);
  return respond({{"score", score}}, 0.6, "Market sentiment score");
}

ProviderResponse RuleBasedDecisionProvider::news(const json& context) {
  const json& market = section(context, "market");
  std::vector<double> scores;
  auto it = market.find("news_sentiment");
  if (it != market.end() && it->is_array()) {
    scores = it->get<std::vector<double>>();
  }
  const double sentiment =
      std::clamp(mean_of_last(scores, scores.size()), -1.0, 1.0);
  const double confidence =
      scores.empty() ? 0.3
                     : std::min(0.9, 0.5 + 0.05 * static_cast<double>(
                                                      scores.size()));
  return respond({{"sentiment", sentiment},
                  {"article_count", static_cast<int>(scores.size())}},
                 confidence,
                 std::to_string(scores.size()) + " articles analyzed");
}

ProviderResponse RuleBasedDecisionProvider::fundamentals(const json& context) {
  const json& indicators = section(section(context, "market"), "indicators");
  std::string valuation = "fairly_valued";
  double confidence = 0.4;
  if (indicators.contains("pe_ratio")) {
    const double pe = indicators.at("pe_ratio").get<double>();
    if (pe > 0.0 && pe < 15.0) {
      valuation = "undervalued";
    } else if (pe > 30.0) {
      valuation = "overvalued";
    }
    confidence = 0.6;
  }
  return respond({{"valuation", valuation},
                  {"revenue_growth", indicators.value("revenue_growth", 0.0)},
                  {"debt_to_equity", indicators.value("debt_to_equity", 0.0)}},
                 confidence, "Valuation " + valuation);
}

ProviderResponse RuleBasedDecisionProvider::bull(const json& context) {
  const json& tech = analyst_content(context, "technical");
  const json& news = analyst_content(context, "news");
  const json& fund = analyst_content(context, "fundamentals");

  std::vector<std::string> points;
  if (tech.value("signal", std::string()) == "BUY") {
    points.emplace_back("Strong technical buy signal");
  }
  if (tech.value("trend", std::string()) == "bullish") {
    points.emplace_back("Positive price momentum");
  }
  if (news.value("sentiment", 0.0) > 0.0) {
    points.emplace_back("Positive news sentiment");
  }
  if (fund.value("valuation", std::string()) == "undervalued") {
    points.emplace_back("Attractive valuation");
  }
  if (fund.value("revenue_growth", 0.0) > 0.1) {
    points.emplace_back("Strong revenue growth");
  }

  const double confidence =
      std::min(0.9, 0.5 + 0.1 * static_cast<double>(points.size()));
  const std::size_t count = points.size();
  if (points.empty()) {
    points.emplace_back("General market conditions favorable");
  }
  return respond({{"recommendation", "BUY"}, {"key_points", points}},
                 confidence,
                 "Identified " + std::to_string(count) + " bullish factors");
}

ProviderResponse RuleBasedDecisionProvider::bear(const json& context) {
  const json& tech = analyst_content(context, "technical");
  const json& news = analyst_content(context, "news");
  const json& fund = analyst_content(context, "fundamentals");

  std::vector<std::string> points;
  if (tech.value("signal", std::string()) == "SELL") {
    points.emplace_back("Technical sell signal");
  }
  if (tech.value("trend", std::string()) == "bearish") {
    points.emplace_back("Negative price momentum");
  }
  if (news.value("sentiment", 0.0) < 0.0) {
    points.emplace_back("Negative news sentiment");
  }
  if (fund.value("valuation", std::string()) == "overvalued") {
    points.emplace_back("Overvalued stock");
  }
  if (fund.value("debt_to_equity", 0.0) > 1.0) {
    points.emplace_back("High debt levels");
  }

  const double confidence =
      std::min(0.9, 0.5 + 0.1 * static_cast<double>(points.size()));
  const std::size_t count = points.size();
  const char* recommendation = count > 2 ? "SELL" : "HOLD";
  if (points.empty()) {
    points.emplace_back("Limited downside catalysts");
  }
  return respond({{"recommendation", recommendation}, {"key_points", points}},
                 confidence,
                 "Identified " + std::to_string(count) + " bearish factors");
}

ProviderResponse RuleBasedDecisionProvider::stance(domain::AgentRole role,
                                                   const json& context) {
  const json& research = section(context, "research");
  const std::string action = research.value("action", std::string("HOLD"));
  const double conviction = research.value("conviction", 0.0);
  const double risk_score = section(context, "risk").value("risk_score", 0.0);
  const double exposure =
      section(context, "portfolio").value("exposure", 0.0);

  json payload;
  double confidence = 0.7;
  std::string rationale;

  switch (role) {
    case domain::AgentRole::Aggressive:
      payload = {{"stance", "aggressive"},
                 {"endorses_trade", action != "HOLD"},
                 {"stop_loss_pct", 0.15},
                 {"take_profit_pct", 0.30}};
      confidence = action == "BUY" ? 0.8 : 0.6;
      rationale = "Maximize returns with calculated risks";
      break;
    case domain::AgentRole::Conservative:
      payload = {{"stance", "conservative"},
                 {"endorses_trade", action == "SELL" || risk_score < 30.0},
                 {"stop_loss_pct", 0.05},
                 {"take_profit_pct", 0.10}};
      confidence = exposure > 0.5 || risk_score > 50.0 ? 0.8 : 0.7;
      rationale = "Protect capital, minimize drawdowns";
      break;
    default:
      payload = {{"stance", "neutral"},
                 {"endorses_trade", conviction >= 0.1},
                 {"stop_loss_pct", 0.10},
                 {"take_profit_pct", 0.20}};
      confidence = 0.7;
      rationale = "Balanced approach to risk and return";
      break;
  }
  return respond(std::move(payload), confidence, std::move(rationale));
}

}  // namespace backtest
