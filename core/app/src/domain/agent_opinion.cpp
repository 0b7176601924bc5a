#include "backtest/domain/agent_opinion.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace backtest {
namespace domain {

namespace {

constexpr std::array<std::pair<AgentRole, const char*>, 9> kRoleNames{{
    {AgentRole::Technical, "technical"},
    {AgentRole::Sentiment, "sentiment"},
    {AgentRole::News, "news"},
    {AgentRole::Fundamentals, "fundamentals"},
    {AgentRole::Bull, "bull"},
    {AgentRole::Bear, "bear"},
    {AgentRole::Aggressive, "aggressive"},
    {AgentRole::Conservative, "conservative"},
    {AgentRole::Neutral, "neutral"},
}};

}  // namespace

const char* to_string(AgentRole role) {
  for (const auto& [r, name] : kRoleNames) {
    if (r == role) {
      return name;
    }
  }
  return "unknown";
}

std::optional<AgentRole> parse_agent_role(const std::string& text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const auto& [role, name] : kRoleNames) {
    if (lower == name) {
      return role;
    }
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace backtest
