#include "backtest/agents/decision_orchestrator.hpp"

#include "backtest/agents/opinion_parser.hpp"
#include "backtest/error/errors.hpp"
#include "backtest/serialization/record_json.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <future>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <utility>

namespace backtest {

namespace {

using domain::AgentRole;

constexpr std::size_t kMemoryDepth = 3;

const std::vector<AgentRole> kAnalysts = {AgentRole::Technical,
                                          AgentRole::Sentiment,
                                          AgentRole::News,
                                          AgentRole::Fundamentals};

const std::vector<AgentRole> kStances = {AgentRole::Aggressive,
                                         AgentRole::Conservative,
                                         AgentRole::Neutral};

domain::TradeAction recommendation_of(const domain::AgentOpinion& opinion) {
  if (const auto* view = std::get_if<domain::AdvocacyView>(&opinion.content)) {
    return view->recommendation;
  }
  return domain::TradeAction::Hold;
}

const domain::StanceView* stance_view(const domain::AgentOpinion& opinion) {
  if (opinion.degraded) {
    return nullptr;
  }
  return std::get_if<domain::StanceView>(&opinion.content);
}

std::string fixed2(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

}  // namespace

DecisionOrchestrator::DecisionOrchestrator(
    const BacktestConfig& config, std::shared_ptr<IDecisionProvider> provider,
    const ITimeProvider& clock, PositionManager& positions,
    MemoryStore& memory, EventBus* bus, ResilientCaller::Sleeper sleeper)
    : config_(config.orchestrator),
      position_config_(config.position),
      call_deadline_(config.retry.call_deadline_ms),
      debug_(config.debug),
      clock_(clock),
      positions_(positions),
      memory_(memory),
      bus_(bus),
      analyzer_(config.risk) {
  if (!provider) {
    throw InvalidConfiguration("DecisionOrchestrator requires a provider");
  }
  if (config.cache.enabled) {
    cache_ = std::make_unique<ResultCache>(clock_, config.cache.capacity,
                                           config.cache.ttl_ms);
  }
  caller_ = std::make_unique<ResilientCaller>(std::move(provider), clock_,
                                              config.retry, std::move(sleeper));
  pool_ = std::make_unique<WorkerPool>(
      std::max(kAnalysts.size(), kStances.size()), "DecisionOrchestrator");
}

// -----------------------------------------------------------------------------
// decide(): phases 1-5
// -----------------------------------------------------------------------------
PendingDecision DecisionOrchestrator::decide(
    const domain::MarketSnapshot& snapshot,
    const domain::PortfolioState& portfolio, const std::atomic<bool>& cancel) {
  PendingDecision pending;
  pending.price = snapshot.close;
  pending.portfolio = portfolio;

  auto& decision = pending.decision;
  decision.id = snapshot.symbol + "-" + format_date(snapshot.date);
  decision.timestamp = snapshot.date;
  decision.symbol = snapshot.symbol;
  decision.order_kind = domain::OrderKind::Market;

  // Phase 1: DataCollection
  memory_.recordBar(snapshot);
  const int lookback = std::max(
      analyzer_.config().lookback_days, analyzer_.config().correlation_window);
  const auto bars = memory_.recentBars(snapshot.symbol,
                                       static_cast<std::size_t>(lookback) + 1);
  const nlohmann::json context = baseContext(snapshot, bars, portfolio);
  trace(snapshot.symbol, "phase 1 collected " + std::to_string(bars.size()) +
                             " bars");
  if (cancel.load()) {
    pending.cancelled = true;
    return pending;
  }

  // Phase 2: IndividualAnalysis
  auto analysts = fanOut(kAnalysts, context, decision.timestamp);
  trace(snapshot.symbol, "phase 2 collected " +
                             std::to_string(analysts.size()) + " analysts");
  if (cancel.load()) {
    pending.cancelled = true;
    decision.opinions = std::move(analysts);
    return pending;
  }

  // Phase 3: CollaborativeAnalysis
  nlohmann::json research_context = context;
  research_context["analysts"] = opinionsJson(analysts);
  auto bull = obtainOpinion(
      AgentRole::Bull, withMemory(AgentRole::Bull, research_context),
      decision.timestamp);
  auto bear = obtainOpinion(
      AgentRole::Bear, withMemory(AgentRole::Bear, research_context),
      decision.timestamp);
  for (int round = 2; round <= config_.max_debate_rounds && !cancel.load();
       ++round) {
    nlohmann::json bull_context = research_context;
    bull_context["debate"] = {{"round", round},
                              {"own", opinionJson(bull)},
                              {"counter", opinionJson(bear)}};
    nlohmann::json bear_context = research_context;
    bear_context["debate"] = {{"round", round},
                              {"own", opinionJson(bear)},
                              {"counter", opinionJson(bull)}};
    bull = obtainOpinion(AgentRole::Bull,
                         withMemory(AgentRole::Bull, bull_context),
                         decision.timestamp);
    bear = obtainOpinion(AgentRole::Bear,
                         withMemory(AgentRole::Bear, bear_context),
                         decision.timestamp);
    trace(snapshot.symbol, "phase 3 debate round " + std::to_string(round));
  }
  const Research research = synthesize(bull, bear);
  trace(snapshot.symbol, std::string("phase 3 provisional ") +
                             domain::to_string(research.action) +
                             " conviction " + fixed2(research.conviction));

  decision.opinions = std::move(analysts);
  decision.opinions.push_back(bull);
  decision.opinions.push_back(bear);
  if (cancel.load()) {
    pending.cancelled = true;
    return pending;
  }

  // Phase 4: RiskDiscussion
  pending.metrics = assessRisk(snapshot.symbol, bars, portfolio);
  if (pending.metrics.risk_score >= analyzer_.config().high_risk_threshold) {
    RiskAlertEvent alert;
    alert.symbol = snapshot.symbol;
    alert.risk_score = pending.metrics.risk_score;
    alert.threshold = analyzer_.config().high_risk_threshold;
    alert.advisories = pending.metrics.recommendations;
    alert.timestamp = decision.timestamp;
    alert.sequence_id = event_sequence_.next_id();
    publish(alert);
  }

  nlohmann::json risk_context = research_context;
  risk_context["research"] = {{"action", domain::to_string(research.action)},
                              {"conviction", research.conviction},
                              {"bull", research.bull},
                              {"bear", research.bear}};
  risk_context["risk"] = {
      {"risk_score", pending.metrics.risk_score},
      {"value_at_risk", pending.metrics.value_at_risk},
      {"size_adjustment", pending.metrics.size_adjustment},
      {"advisories", pending.metrics.recommendations}};
  auto stances = fanOut(kStances, risk_context, decision.timestamp);
  for (int round = 2;
       round <= config_.max_risk_discuss_rounds && !cancel.load(); ++round) {
    nlohmann::json discussion_context = risk_context;
    discussion_context["discussion"] = {{"round", round},
                                        {"perspectives", opinionsJson(stances)}};
    stances = fanOut(kStances, discussion_context, decision.timestamp);
    trace(snapshot.symbol, "phase 4 discussion round " + std::to_string(round));
  }
  trace(snapshot.symbol, "phase 4 risk score " +
                             fixed2(pending.metrics.risk_score));

  for (const auto& opinion : stances) {
    decision.opinions.push_back(opinion);
  }
  if (cancel.load()) {
    pending.cancelled = true;
    return pending;
  }

  // Phase 5: FinalDecision
  finalize(decision, research, stances, pending.metrics);
  trace(snapshot.symbol, std::string("phase 5 ") +
                             domain::to_string(decision.action) + " stance " +
                             domain::to_string(decision.risk.stance) +
                             " confidence " + fixed2(decision.confidence));
  return pending;
}

// -----------------------------------------------------------------------------
// execute(): phase 6
// -----------------------------------------------------------------------------
domain::DecisionRecord DecisionOrchestrator::execute(PendingDecision pending) {
  domain::DecisionRecord record;
  record.risk_metrics = std::move(pending.metrics);
  auto& decision = pending.decision;

  if (pending.cancelled) {
    record.outcome = domain::ExecutionOutcome::Cancelled;
    record.reason = "run cancelled before execution";
  } else if (decision.action == domain::TradeAction::Hold) {
    record.outcome = domain::ExecutionOutcome::Hold;
    record.reason = decision.rationale;
  } else {
    const double quantity = positions_.sizeFor(
        decision, pending.price, pending.portfolio, decision.risk);
    if (quantity <= 0.0) {
      record.outcome = domain::ExecutionOutcome::Skipped;
      record.reason = decision.action == domain::TradeAction::Sell
                          ? "no position to sell"
                          : "size below minimum or position limit reached";
    } else {
      decision.quantity = quantity;
      auto result = positions_.executeTransaction(decision, pending.price);
      if (result.committed()) {
        record.outcome = domain::ExecutionOutcome::Filled;
        record.transaction = result.transaction;
      } else {
        record.outcome = domain::ExecutionOutcome::Rejected;
        record.reason = std::string(domain::to_string(result.status)) + ": " +
                        result.reason;
      }
    }
  }

  if (!pending.cancelled) {
    for (const auto& opinion : decision.opinions) {
      memory_.recordOpinion(opinion);
    }
    memory_.recordDecision(decision);
  }

  trace(decision.symbol, std::string("phase 6 ") +
                             domain::to_string(record.outcome) +
                             (record.reason.empty() ? "" : " (" + record.reason + ")"));

  DecisionEvent event;
  event.decision = decision;
  event.outcome = record.outcome;
  event.timestamp = decision.timestamp;
  event.sequence_id = event_sequence_.next_id();
  publish(event);

  record.decision = std::move(decision);
  return record;
}

domain::DecisionRecord DecisionOrchestrator::runCycle(
    const domain::MarketSnapshot& snapshot, const std::atomic<bool>& cancel) {
  return execute(decide(snapshot, positions_.snapshot(), cancel));
}

std::optional<CacheStats> DecisionOrchestrator::cacheStats() const {
  if (!cache_) {
    return std::nullopt;
  }
  return cache_->stats();
}

std::vector<ChannelStatus> DecisionOrchestrator::channelStatuses() const {
  return caller_->statuses();
}

std::uint64_t DecisionOrchestrator::providerInvocations() const {
  return caller_->providerInvocations();
}

// -----------------------------------------------------------------------------
// obtainOpinion(): cache, then resilient call, then validation
// -----------------------------------------------------------------------------
domain::AgentOpinion DecisionOrchestrator::obtainOpinion(
    AgentRole role, const nlohmann::json& context, Timestamp timestamp) {
  std::string key;
  if (cache_) {
    key = ResultCache::makeKey(role, context);
    if (auto cached = cache_->get(key)) {
      return *cached;
    }
  }

  const auto started = std::chrono::steady_clock::now();
  try {
    ProviderResponse response = caller_->call(role, context);
    const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto opinion = OpinionParser::parse(role, response, timestamp, took);
    if (cache_) {
      cache_->put(key, opinion);
    }
    return opinion;
  } catch (const MalformedOutput& e) {
    std::cerr << "[DecisionOrchestrator] WARNING: rejected "
              << domain::to_string(role) << " output: " << e.what() << "\n";
    return OpinionParser::neutral(role, std::string("malformed output: ") +
                                            e.what(),
                                  config_.degraded_confidence, timestamp);
  } catch (const CircuitOpenError& e) {
    trace(context.value("symbol", std::string()), e.what());
    return OpinionParser::neutral(role, e.what(), config_.degraded_confidence,
                                  timestamp);
  } catch (const std::exception& e) {
    std::cerr << "[DecisionOrchestrator] WARNING: " << domain::to_string(role)
              << " unavailable: " << e.what() << "\n";
    return OpinionParser::neutral(role, e.what(), config_.degraded_confidence,
                                  timestamp);
  }
}

// -----------------------------------------------------------------------------
// fanOut(): one pool task per role, fan-in bounded by the phase deadline
// -----------------------------------------------------------------------------
std::vector<domain::AgentOpinion> DecisionOrchestrator::fanOut(
    const std::vector<AgentRole>& roles, const nlohmann::json& context,
    Timestamp timestamp) {
  const auto deadline =
      std::chrono::steady_clock::now() +
      call_deadline_ * static_cast<long long>(roles.size());

  std::vector<std::future<domain::AgentOpinion>> futures;
  futures.reserve(roles.size());
  for (AgentRole role : roles) {
    futures.push_back(pool_->submit(
        [this, role, role_context = withMemory(role, context), timestamp] {
          return obtainOpinion(role, role_context, timestamp);
        }));
  }

  std::vector<domain::AgentOpinion> opinions;
  opinions.reserve(roles.size());
  for (std::size_t i = 0; i < roles.size(); ++i) {
    if (futures[i].wait_until(deadline) == std::future_status::ready) {
      opinions.push_back(futures[i].get());
      continue;
    }
    std::cerr << "[DecisionOrchestrator] WARNING: "
              << domain::to_string(roles[i]) << " missed the phase deadline\n";
    opinions.push_back(OpinionParser::neutral(
        roles[i], "phase deadline exceeded", config_.degraded_confidence,
        timestamp));
  }
  return opinions;
}

nlohmann::json DecisionOrchestrator::baseContext(
    const domain::MarketSnapshot& snapshot,
    const std::vector<domain::MarketSnapshot>& bars,
    const domain::PortfolioState& portfolio) const {
  std::vector<double> closes;
  closes.reserve(bars.size());
  for (const auto& bar : bars) {
    closes.push_back(bar.close);
  }

  const double total = portfolio.total_value;
  const double invested = portfolio.positionsValue();
  const auto* held = portfolio.find(snapshot.symbol);

  nlohmann::json context;
  context["symbol"] = snapshot.symbol;
  context["date"] = format_date(snapshot.date);
  context["market"] = toJson(snapshot);
  context["history"] = {{"closes", closes}, {"bars", closes.size()}};
  context["portfolio"] = {
      {"cash", portfolio.cash},
      {"total_value", total},
      {"exposure", total > 0.0 ? invested / total : 0.0},
      {"held_quantity", held ? held->quantity : 0.0},
      {"open_positions", portfolio.positions.size()}};
  return context;
}

nlohmann::json DecisionOrchestrator::withMemory(AgentRole role,
                                                nlohmann::json context) const {
  nlohmann::json memory = nlohmann::json::array();
  for (const auto& past : memory_.recentOpinions(role, kMemoryDepth)) {
    memory.push_back({{"date", format_date(past.timestamp)},
                      {"confidence", past.confidence},
                      {"content", OpinionParser::contentToJson(past.content)}});
  }
  context["memory"] = std::move(memory);
  return context;
}

nlohmann::json DecisionOrchestrator::opinionsJson(
    const std::vector<domain::AgentOpinion>& opinions) {
  nlohmann::json by_role = nlohmann::json::object();
  for (const auto& opinion : opinions) {
    by_role[domain::to_string(opinion.role)] = opinionJson(opinion);
  }
  return by_role;
}

nlohmann::json DecisionOrchestrator::opinionJson(
    const domain::AgentOpinion& opinion) {
  return {{"content", OpinionParser::contentToJson(opinion.content)},
          {"confidence", opinion.confidence},
          {"degraded", opinion.degraded}};
}

DecisionOrchestrator::Research DecisionOrchestrator::synthesize(
    const domain::AgentOpinion& bull, const domain::AgentOpinion& bear) {
  Research research;
  research.bull = bull.confidence;
  research.bear = bear.confidence;
  research.conviction = std::fabs(research.bull - research.bear);

  if (research.bull > research.bear &&
      recommendation_of(bull) == domain::TradeAction::Buy) {
    research.action = domain::TradeAction::Buy;
  } else if (research.bear > research.bull &&
             recommendation_of(bear) == domain::TradeAction::Sell) {
    research.action = domain::TradeAction::Sell;
  }
  return research;
}

domain::EnhancedRiskMetrics DecisionOrchestrator::assessRisk(
    const std::string& symbol,
    const std::vector<domain::MarketSnapshot>& bars,
    const domain::PortfolioState& portfolio) const {
  const auto window =
      static_cast<std::size_t>(analyzer_.config().correlation_window) + 1;

  std::map<std::string, std::vector<double>> returns;
  std::map<std::string, double> weights;
  const double invested = portfolio.positionsValue();
  for (const auto& [held, position] : portfolio.positions) {
    returns[held] = RiskAnalyzer::closeReturns(memory_.recentBars(held, window));
    if (invested > 0.0) {
      weights[held] = position.marketValue(position.last_price) / invested;
    }
  }
  returns[symbol] = RiskAnalyzer::closeReturns(memory_.recentBars(symbol, window));

  const auto gap_window =
      static_cast<std::size_t>(analyzer_.config().lookback_days) + 1;
  std::vector<domain::MarketSnapshot> recent = bars;
  if (recent.size() > gap_window) {
    recent.erase(recent.begin(),
                 recent.end() - static_cast<std::ptrdiff_t>(gap_window));
  }
  return analyzer_.analyze(recent, returns, weights);
}

void DecisionOrchestrator::finalize(
    domain::TradingDecision& decision, const Research& research,
    const std::vector<domain::AgentOpinion>& stances,
    const domain::EnhancedRiskMetrics& metrics) const {
  auto& risk = decision.risk;
  const domain::StanceView* views[3] = {nullptr, nullptr, nullptr};
  int endorsing = 0;
  for (const auto& opinion : stances) {
    const double score = opinion.degraded ? 0.0 : opinion.confidence;
    std::size_t slot = 2;
    switch (opinion.role) {
      case AgentRole::Aggressive:
        risk.aggressive_score = score;
        slot = 0;
        break;
      case AgentRole::Conservative:
        risk.conservative_score = score;
        slot = 1;
        break;
      default:
        risk.neutral_score = score;
        break;
    }
    views[slot] = stance_view(opinion);
    if (views[slot] && views[slot]->endorses_trade) {
      ++endorsing;
    }
  }

  const double a = risk.aggressive_score;
  const double c = risk.conservative_score;
  const double n = risk.neutral_score;
  const domain::StanceView* chosen = views[2];
  double multiplier = config_.neutral_multiplier;
  double stop_loss = position_config_.stop_loss_pct;
  double take_profit = position_config_.take_profit_pct;
  if (a > c && a > n) {
    risk.stance = domain::RiskStance::Aggressive;
    chosen = views[0];
    multiplier = config_.aggressive_multiplier;
    stop_loss = config_.aggressive_stop_loss;
    take_profit = config_.aggressive_take_profit;
  } else if (c > a && c > n) {
    risk.stance = domain::RiskStance::Conservative;
    chosen = views[1];
    multiplier = config_.conservative_multiplier;
    stop_loss = config_.conservative_stop_loss;
    take_profit = config_.conservative_take_profit;
  } else {
    risk.stance = domain::RiskStance::Neutral;
  }
  if (chosen && chosen->size_multiplier) {
    multiplier = *chosen->size_multiplier;
  }
  if (chosen && chosen->stop_loss_pct) {
    stop_loss = *chosen->stop_loss_pct;
  }
  if (chosen && chosen->take_profit_pct) {
    take_profit = *chosen->take_profit_pct;
  }

  risk.size_adjustment = metrics.size_adjustment;
  risk.risk_score = metrics.risk_score;
  risk.advisories = metrics.recommendations;
  risk.key_risks = keyRisks(metrics);

  const double agreement =
      static_cast<double>(endorsing) / static_cast<double>(kStances.size());
  decision.confidence = std::clamp(
      std::max(research.bull, research.bear) * 0.5 * (1.0 + agreement), 0.0,
      1.0);
  decision.position_size_pct = position_config_.default_position_pct * multiplier;
  decision.stop_loss_pct = stop_loss;
  decision.take_profit_pct = take_profit;
  decision.action = research.action;

  std::string rationale = "bull " + fixed2(research.bull) + " vs bear " +
                          fixed2(research.bear) + ", stance " +
                          domain::to_string(risk.stance) + ", agreement " +
                          std::to_string(endorsing) + "/3";
  if (decision.action != domain::TradeAction::Hold &&
      decision.confidence < config_.min_confidence) {
    rationale += ", " + std::string(domain::to_string(decision.action)) +
                 " dropped: confidence " + fixed2(decision.confidence) +
                 " below " + fixed2(config_.min_confidence);
    decision.action = domain::TradeAction::Hold;
  }
  decision.rationale = std::move(rationale);
}

std::vector<std::string> DecisionOrchestrator::keyRisks(
    const domain::EnhancedRiskMetrics& metrics) const {
  const auto& cfg = analyzer_.config();
  std::vector<std::string> risks;
  if (metrics.gap.max_gap > cfg.large_gap_threshold ||
      metrics.gap.gap_frequency > cfg.frequent_gap_threshold) {
    risks.emplace_back("gap_risk");
  }
  if (metrics.correlation.portfolio_correlation >
      cfg.high_correlation_threshold) {
    risks.emplace_back("correlation_risk");
  }
  if (metrics.risk_score >= cfg.moderate_risk_threshold) {
    risks.emplace_back("elevated_risk_score");
  }
  if (metrics.value_at_risk > position_config_.stop_loss_pct) {
    risks.emplace_back("value_at_risk");
  }
  return risks;
}

void DecisionOrchestrator::trace(const std::string& symbol,
                                 const std::string& message) const {
  if (debug_) {
    std::cout << "[DecisionOrchestrator] " << symbol << ": " << message
              << "\n";
  }
}

void DecisionOrchestrator::publish(const Event& event) {
  if (bus_ != nullptr) {
    bus_->publish(event);
  }
}

}  // namespace backtest
