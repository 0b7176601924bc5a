// =============================================================================
// decision_orchestrator_test.cpp
// =============================================================================
// Unit tests for backtest::DecisionOrchestrator.
//
// Validates:
//   - A full cycle: nine opinions, stance selection, confidence formula,
//     sizing and a FILLED transaction
//   - Repeating an identical decision is served from the cache with zero
//     provider calls
//   - Failed, malformed, circuit-open and slow opinions degrade to neutral
//     placeholders instead of failing the cycle
//   - Stance ties resolve to NEUTRAL; a degraded stance never wins; a
//     stance's own size_multiplier overrides the configured one; low
//     confidence turns into HOLD
//   - Extra debate and risk discussion rounds re-ask the debaters with the
//     other sides' latest opinions
//   - Insufficient funds: a BUY that a competing fill left uncovered is
//     recorded as REJECTED with the portfolio untouched
//   - Cancellation yields CANCELLED without touching the portfolio
//   - DecisionEvent / RiskAlertEvent publication
// =============================================================================

#include "backtest/agents/decision_orchestrator.hpp"
#include "backtest/error/errors.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using backtest::domain::AgentRole;
using backtest::domain::ExecutionOutcome;
using backtest::domain::RiskStance;
using backtest::domain::TradeAction;
using backtest::testing_support::ManualClock;
using backtest::testing_support::ScriptedProvider;
using backtest::testing_support::advocacy;
using backtest::testing_support::makeBar;
using backtest::testing_support::respond;
using backtest::testing_support::stance;

class DecisionOrchestratorTest : public ::testing::Test {
 protected:
  DecisionOrchestratorTest() {
    config.retry.max_attempts = 1;
    config.retry.base_delay_ms = 1;
    config.retry.call_timeout_ms = 2'000;
    config.retry.call_deadline_ms = 5'000;
    config.retry.failure_threshold = 100;
  }

  std::unique_ptr<backtest::DecisionOrchestrator> make() {
    return std::make_unique<backtest::DecisionOrchestrator>(
        config, provider, clock, positions, memory, &bus,
        backtest::testing_support::noSleep);
  }

  // Bull 0.8 BUY over bear 0.4, aggressive stance strongest, all endorse.
  void scriptBuy() {
    provider->script(AgentRole::Bull, [](const nlohmann::json&) {
      return advocacy("BUY", 0.8);
    });
    provider->script(AgentRole::Bear, [](const nlohmann::json&) {
      return advocacy("HOLD", 0.4);
    });
    provider->script(AgentRole::Aggressive, [](const nlohmann::json&) {
      return stance("aggressive", true, 0.9);
    });
    provider->script(AgentRole::Conservative, [](const nlohmann::json&) {
      return stance("conservative", true, 0.5);
    });
    provider->script(AgentRole::Neutral, [](const nlohmann::json&) {
      return stance("neutral", true, 0.6);
    });
  }

  backtest::BacktestConfig config;
  ManualClock clock;
  std::shared_ptr<ScriptedProvider> provider =
      std::make_shared<ScriptedProvider>();
  backtest::EventBus bus;
  backtest::PositionManager positions{backtest::PositionConfig{}, 100'000.0,
                                      &bus};
  backtest::MemoryStore memory{250, 1'000};
  std::atomic<bool> cancel{false};
};

// -----------------------------------------------------------------------------
// Aggressive wins: size 10% * 1.3, confidence 0.8 * 0.5 * (1 + 3/3).
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, FullCycleFillsBuy) {
  scriptBuy();
  auto orchestrator = make();
  const auto bar = makeBar("AAPL", "2024-01-02", 100.0);

  const auto record = orchestrator->runCycle(bar, cancel);

  const auto& d = record.decision;
  EXPECT_EQ(d.id, "AAPL-2024-01-02");
  EXPECT_EQ(d.timestamp, bar.date);
  EXPECT_EQ(d.action, TradeAction::Buy);
  EXPECT_EQ(d.risk.stance, RiskStance::Aggressive);
  EXPECT_DOUBLE_EQ(d.risk.aggressive_score, 0.9);
  EXPECT_NEAR(d.confidence, 0.8, 1e-12);
  EXPECT_NEAR(d.position_size_pct, 0.13, 1e-12);
  EXPECT_DOUBLE_EQ(d.stop_loss_pct, config.orchestrator.aggressive_stop_loss);
  EXPECT_DOUBLE_EQ(d.take_profit_pct,
                   config.orchestrator.aggressive_take_profit);
  ASSERT_EQ(d.opinions.size(), 9u);
  EXPECT_EQ(d.opinions[0].role, AgentRole::Technical);
  EXPECT_EQ(d.opinions[4].role, AgentRole::Bull);
  EXPECT_EQ(d.opinions[8].role, AgentRole::Neutral);

  ASSERT_EQ(record.outcome, ExecutionOutcome::Filled) << record.reason;
  ASSERT_TRUE(record.transaction.has_value());
  EXPECT_NEAR(record.transaction->quantity, 130.0, 1e-9);
  EXPECT_NEAR(d.quantity, 130.0, 1e-9);

  const auto held = positions.snapshot();
  ASSERT_NE(held.find("AAPL"), nullptr);
  EXPECT_DOUBLE_EQ(held.find("AAPL")->stop_loss_pct, 0.15);
  EXPECT_EQ(memory.recentDecisions("AAPL", 10).size(), 1u);
  EXPECT_EQ(memory.recentOpinions(AgentRole::Bull, 10).size(), 1u);
}

// -----------------------------------------------------------------------------
// The same (symbol, date, portfolio) decided twice: the second pass is
// answered entirely from the cache.
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, RepeatedDecisionServedFromCache) {
  scriptBuy();
  auto orchestrator = make();
  const auto bar = makeBar("AAPL", "2024-01-02", 100.0);
  const auto portfolio = positions.snapshot();

  const auto first = orchestrator->decide(bar, portfolio, cancel);
  const int calls = provider->totalCalls();
  EXPECT_EQ(calls, 9);

  const auto second = orchestrator->decide(bar, portfolio, cancel);
  EXPECT_EQ(provider->totalCalls(), calls);
  EXPECT_EQ(second.decision.action, first.decision.action);
  EXPECT_DOUBLE_EQ(second.decision.confidence, first.decision.confidence);

  const auto stats = orchestrator->cacheStats();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->hits, 9u);
  EXPECT_EQ(stats->misses, 9u);
}

TEST_F(DecisionOrchestratorTest, CacheCanBeDisabled) {
  config.cache.enabled = false;
  scriptBuy();
  auto orchestrator = make();
  const auto bar = makeBar("AAPL", "2024-01-02", 100.0);

  orchestrator->decide(bar, positions.snapshot(), cancel);
  orchestrator->decide(bar, positions.snapshot(), cancel);

  EXPECT_EQ(provider->totalCalls(), 18);
  EXPECT_FALSE(orchestrator->cacheStats().has_value());
}

// -----------------------------------------------------------------------------
// Failures degrade, the cycle still completes.
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, FailedAndMalformedOpinionsDegrade) {
  scriptBuy();
  provider->script(AgentRole::Technical, [](const nlohmann::json&)
                                             -> backtest::ProviderResponse {
    throw backtest::ProviderError("backend down");
  });
  provider->script(AgentRole::Sentiment, [](const nlohmann::json&) {
    return respond({{"score", 5.0}}, 0.9);
  });
  auto orchestrator = make();

  const auto record =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);

  const auto& technical = record.decision.opinions[0];
  EXPECT_TRUE(technical.degraded);
  EXPECT_DOUBLE_EQ(technical.confidence, config.orchestrator.degraded_confidence);
  EXPECT_TRUE(std::holds_alternative<backtest::domain::NeutralView>(
      technical.content));

  const auto& sentiment = record.decision.opinions[1];
  EXPECT_TRUE(sentiment.degraded);
  EXPECT_NE(sentiment.rationale.find("malformed"), std::string::npos);
  EXPECT_EQ(provider->calls(AgentRole::Sentiment), 1);

  EXPECT_FALSE(record.decision.opinions[2].degraded);
  EXPECT_EQ(record.outcome, ExecutionOutcome::Filled);
}

TEST_F(DecisionOrchestratorTest, OpenCircuitSkipsProviderOnLaterCycles) {
  config.retry.failure_threshold = 1;
  scriptBuy();
  provider->script(AgentRole::News, [](const nlohmann::json&)
                                        -> backtest::ProviderResponse {
    throw backtest::TimeoutError("no answer");
  });
  auto orchestrator = make();

  orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);
  const auto second =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-03", 101.0), cancel);

  EXPECT_EQ(provider->calls(AgentRole::News), 1);
  EXPECT_TRUE(second.decision.opinions[2].degraded);
  EXPECT_NE(second.decision.opinions[2].rationale.find("circuit open"),
            std::string::npos);

  bool found = false;
  for (const auto& status : orchestrator->channelStatuses()) {
    if (status.channel == "news") {
      found = true;
      EXPECT_EQ(status.state, "OPEN");
    }
  }
  EXPECT_TRUE(found);
}

// -----------------------------------------------------------------------------
// An analyst slower than the call deadline is replaced by a placeholder; the
// others are kept.
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, SlowAnalystReplacedAtDeadline) {
  config.retry.call_deadline_ms = 50;
  scriptBuy();
  provider->script(AgentRole::Fundamentals, [](const nlohmann::json&) {
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    return respond({{"valuation", "undervalued"}}, 0.9);
  });
  auto orchestrator = make();

  const auto pending = orchestrator->decide(makeBar("AAPL", "2024-01-02", 100.0),
                                            positions.snapshot(), cancel);

  const auto& fundamentals = pending.decision.opinions[3];
  EXPECT_EQ(fundamentals.role, AgentRole::Fundamentals);
  EXPECT_TRUE(fundamentals.degraded);
  EXPECT_NE(fundamentals.rationale.find("exceeded"), std::string::npos)
      << fundamentals.rationale;
  EXPECT_FALSE(pending.decision.opinions[0].degraded);
  EXPECT_EQ(pending.decision.action, TradeAction::Buy);
}

// -----------------------------------------------------------------------------
// Final decision rules
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, StanceTieResolvesToNeutral) {
  scriptBuy();
  for (auto role : {AgentRole::Aggressive, AgentRole::Conservative,
                    AgentRole::Neutral}) {
    const std::string name = backtest::domain::to_string(role);
    provider->script(role, [name](const nlohmann::json&) {
      return stance(name, true, 0.7);
    });
  }
  auto orchestrator = make();

  const auto pending = orchestrator->decide(makeBar("AAPL", "2024-01-02", 100.0),
                                            positions.snapshot(), cancel);

  EXPECT_EQ(pending.decision.risk.stance, RiskStance::Neutral);
  EXPECT_NEAR(pending.decision.position_size_pct,
              backtest::PositionConfig{}.default_position_pct, 1e-12);
  EXPECT_DOUBLE_EQ(pending.decision.stop_loss_pct,
                   backtest::PositionConfig{}.stop_loss_pct);
}

TEST_F(DecisionOrchestratorTest, ConservativeStanceShrinksSize) {
  scriptBuy();
  provider->script(AgentRole::Conservative, [](const nlohmann::json&) {
    return respond({{"stance", "conservative"},
                    {"endorses_trade", true},
                    {"stop_loss_pct", 0.04}},
                   0.95);
  });
  auto orchestrator = make();

  const auto pending = orchestrator->decide(makeBar("AAPL", "2024-01-02", 100.0),
                                            positions.snapshot(), cancel);

  EXPECT_EQ(pending.decision.risk.stance, RiskStance::Conservative);
  EXPECT_NEAR(pending.decision.position_size_pct, 0.07, 1e-12);
  EXPECT_DOUBLE_EQ(pending.decision.stop_loss_pct, 0.04);
  EXPECT_DOUBLE_EQ(pending.decision.take_profit_pct,
                   config.orchestrator.conservative_take_profit);
}

TEST_F(DecisionOrchestratorTest, StanceSizeMultiplierOverridesConfig) {
  scriptBuy();
  provider->script(AgentRole::Aggressive, [](const nlohmann::json&) {
    return respond({{"stance", "aggressive"},
                    {"endorses_trade", true},
                    {"size_multiplier", 1.1}},
                   0.9);
  });
  auto orchestrator = make();

  const auto pending = orchestrator->decide(makeBar("AAPL", "2024-01-02", 100.0),
                                            positions.snapshot(), cancel);

  EXPECT_EQ(pending.decision.risk.stance, RiskStance::Aggressive);
  EXPECT_NEAR(pending.decision.position_size_pct, 0.11, 1e-12);
}

// -----------------------------------------------------------------------------
// A failed aggressive call must not win the stance vote with its placeholder
// confidence when the real stances score lower.
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, DegradedStanceScoresZero) {
  scriptBuy();
  provider->script(AgentRole::Aggressive, [](const nlohmann::json&)
                                              -> backtest::ProviderResponse {
    throw backtest::ProviderError("backend down");
  });
  provider->script(AgentRole::Conservative, [](const nlohmann::json&) {
    return stance("conservative", true, 0.05);
  });
  provider->script(AgentRole::Neutral, [](const nlohmann::json&) {
    return stance("neutral", true, 0.08);
  });
  auto orchestrator = make();

  const auto pending = orchestrator->decide(makeBar("AAPL", "2024-01-02", 100.0),
                                            positions.snapshot(), cancel);

  EXPECT_TRUE(pending.decision.opinions[6].degraded);
  EXPECT_DOUBLE_EQ(pending.decision.risk.aggressive_score, 0.0);
  EXPECT_EQ(pending.decision.risk.stance, RiskStance::Neutral);
  EXPECT_NEAR(pending.decision.position_size_pct,
              backtest::PositionConfig{}.default_position_pct, 1e-12);
}

TEST_F(DecisionOrchestratorTest, LowConfidenceBecomesHold) {
  scriptBuy();
  provider->script(AgentRole::Bull, [](const nlohmann::json&) {
    return advocacy("BUY", 0.4);
  });
  provider->script(AgentRole::Bear, [](const nlohmann::json&) {
    return advocacy("HOLD", 0.2);
  });
  for (auto role : {AgentRole::Aggressive, AgentRole::Conservative,
                    AgentRole::Neutral}) {
    const std::string name = backtest::domain::to_string(role);
    provider->script(role, [name](const nlohmann::json&) {
      return stance(name, false, 0.7);
    });
  }
  auto orchestrator = make();

  // 0.4 * 0.5 * (1 + 0) = 0.2 < 0.3
  const auto record =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);

  EXPECT_EQ(record.decision.action, TradeAction::Hold);
  EXPECT_NEAR(record.decision.confidence, 0.2, 1e-12);
  EXPECT_NE(record.decision.rationale.find("dropped"), std::string::npos);
  EXPECT_EQ(record.outcome, ExecutionOutcome::Hold);
  EXPECT_TRUE(positions.transactions().empty());
}

TEST_F(DecisionOrchestratorTest, BullWithoutBuyRecommendationHolds) {
  scriptBuy();
  provider->script(AgentRole::Bull, [](const nlohmann::json&) {
    return advocacy("HOLD", 0.9);
  });
  auto orchestrator = make();

  const auto record =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);
  EXPECT_EQ(record.decision.action, TradeAction::Hold);
  EXPECT_EQ(record.outcome, ExecutionOutcome::Hold);
}

// -----------------------------------------------------------------------------
// SELL with nothing held is skipped; after a BUY it closes the position.
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, SellSkippedWhenFlatThenFilledWhenHeld) {
  scriptBuy();
  auto orchestrator = make();
  auto bearish = [this] {
    provider->script(AgentRole::Bull, [](const nlohmann::json&) {
      return advocacy("BUY", 0.3);
    });
    provider->script(AgentRole::Bear, [](const nlohmann::json&) {
      return advocacy("SELL", 0.9);
    });
  };

  bearish();
  const auto skipped =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);
  EXPECT_EQ(skipped.decision.action, TradeAction::Sell);
  EXPECT_EQ(skipped.outcome, ExecutionOutcome::Skipped);
  EXPECT_EQ(skipped.reason, "no position to sell");

  scriptBuy();
  ASSERT_EQ(orchestrator->runCycle(makeBar("AAPL", "2024-01-03", 100.0), cancel)
                .outcome,
            ExecutionOutcome::Filled);

  bearish();
  const auto sold =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-04", 102.0), cancel);
  ASSERT_EQ(sold.outcome, ExecutionOutcome::Filled) << sold.reason;
  EXPECT_EQ(sold.transaction->action, TradeAction::Sell);
  EXPECT_TRUE(positions.snapshot().positions.empty());
  EXPECT_EQ(positions.closedPositions().size(), 1u);
}

// -----------------------------------------------------------------------------
// Context handed to later phases
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, LaterPhasesSeeEarlierResults) {
  scriptBuy();
  auto bull_context = std::make_shared<nlohmann::json>();
  auto neutral_context = std::make_shared<nlohmann::json>();
  provider->script(AgentRole::Bull, [bull_context](const nlohmann::json& c) {
    *bull_context = c;
    return advocacy("BUY", 0.8);
  });
  provider->script(AgentRole::Neutral,
                   [neutral_context](const nlohmann::json& c) {
                     *neutral_context = c;
                     return stance("neutral", true, 0.6);
                   });
  auto orchestrator = make();

  orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);

  ASSERT_TRUE(bull_context->contains("analysts"));
  EXPECT_EQ((*bull_context)["analysts"].size(), 4u);
  EXPECT_EQ((*bull_context)["symbol"], "AAPL");
  EXPECT_TRUE((*bull_context)["memory"].empty());

  ASSERT_TRUE(neutral_context->contains("research"));
  EXPECT_EQ((*neutral_context)["research"]["action"], "BUY");
  EXPECT_TRUE(neutral_context->contains("risk"));

  // Next day the bull sees its own previous opinion.
  orchestrator->runCycle(makeBar("AAPL", "2024-01-03", 100.0), cancel);
  EXPECT_EQ((*bull_context)["memory"].size(), 1u);
  EXPECT_EQ((*bull_context)["history"]["bars"], 2);
}

// -----------------------------------------------------------------------------
// Two rounds each: bull/bear and the three stances are asked twice, the
// analysts once; the second pass carries the other sides' opinions.
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, ExtraRoundsRequeryDebaters) {
  config.orchestrator.max_debate_rounds = 2;
  config.orchestrator.max_risk_discuss_rounds = 2;
  scriptBuy();
  auto bull_context = std::make_shared<nlohmann::json>();
  auto conservative_context = std::make_shared<nlohmann::json>();
  provider->script(AgentRole::Bull, [bull_context](const nlohmann::json& c) {
    *bull_context = c;
    return advocacy("BUY", 0.8);
  });
  provider->script(AgentRole::Conservative,
                   [conservative_context](const nlohmann::json& c) {
                     *conservative_context = c;
                     return stance("conservative", true, 0.5);
                   });
  auto orchestrator = make();

  const auto record =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);

  EXPECT_EQ(provider->calls(AgentRole::Technical), 1);
  EXPECT_EQ(provider->calls(AgentRole::Fundamentals), 1);
  EXPECT_EQ(provider->calls(AgentRole::Bull), 2);
  EXPECT_EQ(provider->calls(AgentRole::Bear), 2);
  EXPECT_EQ(provider->calls(AgentRole::Aggressive), 2);
  EXPECT_EQ(provider->calls(AgentRole::Conservative), 2);
  EXPECT_EQ(provider->calls(AgentRole::Neutral), 2);
  EXPECT_EQ(provider->totalCalls(), 14);

  ASSERT_TRUE(bull_context->contains("debate"));
  EXPECT_EQ((*bull_context)["debate"]["round"], 2);
  EXPECT_EQ((*bull_context)["debate"]["counter"]["content"]["recommendation"],
            "HOLD");
  EXPECT_EQ((*bull_context)["debate"]["own"]["content"]["recommendation"],
            "BUY");

  ASSERT_TRUE(conservative_context->contains("discussion"));
  const auto& perspectives = (*conservative_context)["discussion"]["perspectives"];
  EXPECT_EQ(perspectives.size(), 3u);
  EXPECT_DOUBLE_EQ(perspectives["aggressive"]["confidence"].get<double>(), 0.9);

  EXPECT_EQ(record.decision.opinions.size(), 9u);
  EXPECT_EQ(record.decision.risk.stance, RiskStance::Aggressive);
  EXPECT_EQ(record.outcome, ExecutionOutcome::Filled);
}

// -----------------------------------------------------------------------------
// Insufficient funds: the decision is sized on the portfolio it saw, then a
// fill for another symbol spends most of the cash before execution.
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, BuyUncoveredAfterCompetingFillIsRejected) {
  scriptBuy();
  auto orchestrator = make();
  const auto bar = makeBar("AAPL", "2024-01-02", 100.0);

  auto pending = orchestrator->decide(bar, positions.snapshot(), cancel);
  ASSERT_EQ(pending.decision.action, TradeAction::Buy);

  backtest::domain::TradingDecision competing;
  competing.id = "MSFT-2024-01-02";
  competing.timestamp = bar.date;
  competing.action = TradeAction::Buy;
  competing.symbol = "MSFT";
  competing.quantity = 940;
  ASSERT_TRUE(positions.executeTransaction(competing, 100.0).committed());

  const auto before = positions.snapshot();
  const auto transactions_before = positions.transactions().size();
  std::vector<backtest::DecisionEvent> events;
  bus.subscribe<backtest::DecisionEvent>(
      [&events](const backtest::DecisionEvent& e) { events.push_back(e); });

  const auto record = orchestrator->execute(std::move(pending));

  EXPECT_EQ(record.outcome, ExecutionOutcome::Rejected);
  EXPECT_FALSE(record.transaction.has_value());
  EXPECT_FALSE(record.reason.empty());
  EXPECT_NE(record.reason.find("InsufficientFunds"), std::string::npos)
      << record.reason;

  const auto after = positions.snapshot();
  EXPECT_DOUBLE_EQ(after.cash, before.cash);
  EXPECT_DOUBLE_EQ(after.total_value, before.total_value);
  EXPECT_EQ(after.positions.size(), 1u);
  EXPECT_EQ(after.find("AAPL"), nullptr);
  EXPECT_EQ(positions.transactions().size(), transactions_before);
  EXPECT_FALSE(positions.checkInvariants().has_value());

  EXPECT_EQ(memory.recentDecisions("AAPL", 10).size(), 1u);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].outcome, ExecutionOutcome::Rejected);
}

// -----------------------------------------------------------------------------
// Cancellation
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, CancelledCycleLeavesPortfolioUntouched) {
  scriptBuy();
  auto orchestrator = make();
  cancel.store(true);

  const auto record =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);

  EXPECT_EQ(record.outcome, ExecutionOutcome::Cancelled);
  EXPECT_EQ(provider->totalCalls(), 0);
  EXPECT_TRUE(positions.transactions().empty());
  EXPECT_TRUE(memory.recentDecisions("AAPL", 10).empty());
}

TEST_F(DecisionOrchestratorTest, CancelDuringAnalysisStopsBeforeResearch) {
  scriptBuy();
  provider->script(AgentRole::Technical, [this](const nlohmann::json&) {
    cancel.store(true);
    return respond({{"signal", "BUY"}}, 0.7);
  });
  auto orchestrator = make();

  const auto record =
      orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);

  EXPECT_EQ(record.outcome, ExecutionOutcome::Cancelled);
  EXPECT_EQ(provider->calls(AgentRole::Bull), 0);
  EXPECT_EQ(record.decision.opinions.size(), 4u);
}

// -----------------------------------------------------------------------------
// Events
// -----------------------------------------------------------------------------
TEST_F(DecisionOrchestratorTest, PublishesDecisionEvent) {
  scriptBuy();
  std::vector<backtest::DecisionEvent> events;
  bus.subscribe<backtest::DecisionEvent>(
      [&events](const backtest::DecisionEvent& e) { events.push_back(e); });
  auto orchestrator = make();

  orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].outcome, ExecutionOutcome::Filled);
  EXPECT_EQ(events[0].decision.symbol, "AAPL");
  EXPECT_EQ(events[0].decision.action, TradeAction::Buy);
}

TEST_F(DecisionOrchestratorTest, PublishesRiskAlertAtThreshold) {
  config.risk.high_risk_threshold = 0.0;
  scriptBuy();
  std::vector<backtest::RiskAlertEvent> alerts;
  bus.subscribe<backtest::RiskAlertEvent>(
      [&alerts](const backtest::RiskAlertEvent& e) { alerts.push_back(e); });
  auto orchestrator = make();

  orchestrator->runCycle(makeBar("AAPL", "2024-01-02", 100.0), cancel);

  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].symbol, "AAPL");
  EXPECT_DOUBLE_EQ(alerts[0].threshold, 0.0);
}

TEST(DecisionOrchestratorConstruction, RequiresProvider) {
  backtest::BacktestConfig config;
  ManualClock clock;
  backtest::PositionManager positions{config.position, 1'000.0};
  backtest::MemoryStore memory{10, 10};
  EXPECT_THROW(backtest::DecisionOrchestrator(config, nullptr, clock, positions,
                                              memory),
               backtest::InvalidConfiguration);
}
