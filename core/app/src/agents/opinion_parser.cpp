#include "backtest/agents/opinion_parser.hpp"

#include "backtest/error/errors.hpp"

#include <cmath>
#include <utility>

namespace backtest {

namespace {

using domain::AgentRole;

double bounded(const nlohmann::json& payload, const char* key, double lo,
               double hi) {
  const double value = payload.at(key).get<double>();
  if (!std::isfinite(value) || value < lo || value > hi) {
    throw MalformedOutput(std::string(key) + " out of range: " +
                          std::to_string(value));
  }
  return value;
}

domain::TradeAction action_field(const nlohmann::json& payload,
                                 const char* key) {
  const std::string text = payload.at(key).get<std::string>();
  auto action = domain::parse_trade_action(text);
  if (!action) {
    throw MalformedOutput(std::string(key) + " is not an action: '" + text +
                          "'");
  }
  return *action;
}

std::optional<double> optional_pct(const nlohmann::json& payload,
                                   const char* key) {
  if (!payload.contains(key) || payload.at(key).is_null()) {
    return std::nullopt;
  }
  return bounded(payload, key, 1e-9, 1.0);
}

domain::RiskStance expected_stance(AgentRole role) {
  switch (role) {
    case AgentRole::Aggressive:   return domain::RiskStance::Aggressive;
    case AgentRole::Conservative: return domain::RiskStance::Conservative;
    default:                      return domain::RiskStance::Neutral;
  }
}

domain::OpinionContent parse_checked(AgentRole role,
                                     const nlohmann::json& payload) {
  switch (role) {
    case AgentRole::Technical: {
      domain::TechnicalView v;
      v.signal = action_field(payload, "signal");
      v.trend = payload.value("trend", std::string("neutral"));
      if (payload.contains("rsi")) {
        v.rsi = bounded(payload, "rsi", 0.0, 100.0);
      }
      v.macd = payload.value("macd", 0.0);
      return v;
    }
    case AgentRole::Sentiment: {
      domain::SentimentView v;
      v.score = bounded(payload, "score", -1.0, 1.0);
      return v;
    }
    case AgentRole::News: {
      domain::NewsView v;
      v.sentiment = bounded(payload, "sentiment", -1.0, 1.0);
      v.article_count = payload.value("article_count", 0);
      if (v.article_count < 0) {
        throw MalformedOutput("article_count must be >= 0");
      }
      return v;
    }
    case AgentRole::Fundamentals: {
      domain::FundamentalsView v;
      v.valuation = payload.at("valuation").get<std::string>();
      if (v.valuation != "undervalued" && v.valuation != "fairly_valued" &&
          v.valuation != "overvalued") {
        throw MalformedOutput("unknown valuation '" + v.valuation + "'");
      }
      v.revenue_growth = payload.value("revenue_growth", 0.0);
      v.debt_to_equity = payload.value("debt_to_equity", 0.0);
      return v;
    }
    case AgentRole::Bull:
    case AgentRole::Bear: {
      domain::AdvocacyView v;
      v.recommendation = action_field(payload, "recommendation");
      if (payload.contains("key_points")) {
        v.key_points =
            payload.at("key_points").get<std::vector<std::string>>();
      }
      return v;
    }
    case AgentRole::Aggressive:
    case AgentRole::Conservative:
    case AgentRole::Neutral: {
      domain::StanceView v;
      const std::string text = payload.at("stance").get<std::string>();
      auto stance = domain::parse_risk_stance(text);
      if (!stance || *stance != expected_stance(role)) {
        throw MalformedOutput("stance '" + text + "' does not match role " +
                              domain::to_string(role));
      }
      v.stance = *stance;
      v.endorses_trade = payload.at("endorses_trade").get<bool>();
      if (payload.contains("size_multiplier")) {
        v.size_multiplier = bounded(payload, "size_multiplier", 1e-9, 10.0);
      }
      v.stop_loss_pct = optional_pct(payload, "stop_loss_pct");
      v.take_profit_pct = optional_pct(payload, "take_profit_pct");
      return v;
    }
  }
  throw MalformedOutput("unhandled role");
}

}  // namespace

domain::OpinionContent OpinionParser::parseContent(
    AgentRole role, const nlohmann::json& payload) {
  if (!payload.is_object()) {
    throw MalformedOutput(std::string(domain::to_string(role)) +
                          ": payload is not a JSON object");
  }
  try {
    return parse_checked(role, payload);
  } catch (const nlohmann::json::exception& e) {
    throw MalformedOutput(std::string(domain::to_string(role)) + ": " +
                          e.what());
  } catch (const MalformedOutput& e) {
    throw MalformedOutput(std::string(domain::to_string(role)) + ": " +
                          e.what());
  }
}

domain::AgentOpinion OpinionParser::parse(
    AgentRole role, const ProviderResponse& response, Timestamp timestamp,
    std::chrono::milliseconds processing_time) {
  if (!std::isfinite(response.confidence) || response.confidence < 0.0 ||
      response.confidence > 1.0) {
    throw MalformedOutput(std::string(domain::to_string(role)) +
                          ": confidence out of [0, 1]");
  }

  domain::AgentOpinion opinion;
  opinion.role = role;
  opinion.agent_id = std::string(domain::to_string(role)) + "_agent";
  opinion.timestamp = timestamp;
  opinion.content = parseContent(role, response.payload);
  opinion.confidence = response.confidence;
  opinion.rationale = response.rationale;
  opinion.processing_time = processing_time;
  return opinion;
}

domain::AgentOpinion OpinionParser::neutral(AgentRole role, std::string reason,
                                            double confidence,
                                            Timestamp timestamp) {
  domain::AgentOpinion opinion;
  opinion.role = role;
  opinion.agent_id = std::string(domain::to_string(role)) + "_agent";
  opinion.timestamp = timestamp;
  opinion.content = domain::NeutralView{reason};
  opinion.confidence = confidence;
  opinion.rationale = std::move(reason);
  opinion.degraded = true;
  return opinion;
}

nlohmann::json OpinionParser::contentToJson(
    const domain::OpinionContent& content) {
  nlohmann::json j;
  if (const auto* v = std::get_if<domain::TechnicalView>(&content)) {
    j["signal"] = domain::to_string(v->signal);
    j["trend"] = v->trend;
    j["rsi"] = v->rsi;
    j["macd"] = v->macd;
  } else if (const auto* v = std::get_if<domain::SentimentView>(&content)) {
    j["score"] = v->score;
  } else if (const auto* v = std::get_if<domain::NewsView>(&content)) {
    j["sentiment"] = v->sentiment;
    j["article_count"] = v->article_count;
  } else if (const auto* v = std::get_if<domain::FundamentalsView>(&content)) {
    j["valuation"] = v->valuation;
    j["revenue_growth"] = v->revenue_growth;
    j["debt_to_equity"] = v->debt_to_equity;
  } else if (const auto* v = std::get_if<domain::AdvocacyView>(&content)) {
    j["recommendation"] = domain::to_string(v->recommendation);
    j["key_points"] = v->key_points;
  } else if (const auto* v = std::get_if<domain::StanceView>(&content)) {
    j["stance"] = domain::to_string(v->stance);
    j["endorses_trade"] = v->endorses_trade;
    if (v->size_multiplier) {
      j["size_multiplier"] = *v->size_multiplier;
    }
    if (v->stop_loss_pct) {
      j["stop_loss_pct"] = *v->stop_loss_pct;
    }
    if (v->take_profit_pct) {
      j["take_profit_pct"] = *v->take_profit_pct;
    }
  } else if (const auto* v = std::get_if<domain::NeutralView>(&content)) {
    j["neutral"] = true;
    j["reason"] = v->reason;
  }
  return j;
}

nlohmann::json OpinionParser::toJson(const domain::AgentOpinion& opinion) {
  nlohmann::json j;
  j["role"] = domain::to_string(opinion.role);
  j["agent_id"] = opinion.agent_id;
  j["timestamp"] = format_date(opinion.timestamp);
  j["content"] = contentToJson(opinion.content);
  j["confidence"] = opinion.confidence;
  j["rationale"] = opinion.rationale;
  j["processing_ms"] = opinion.processing_time.count();
  j["degraded"] = opinion.degraded;
  return j;
}

}  // namespace backtest
