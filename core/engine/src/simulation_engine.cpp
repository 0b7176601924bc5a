#include "backtest/engine/simulation_engine.hpp"

#include "backtest/error/errors.hpp"
#include "backtest/events/event_types.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <utility>

namespace backtest {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SimulationEngine::SimulationEngine(BacktestConfig config,
                                   const IMarketDataProvider& market_data,
                                   std::shared_ptr<IDecisionProvider> provider,
                                   IPersistenceCollaborator* persistence,
                                   const ITimeProvider* wall_clock,
                                   ResilientCaller::Sleeper sleeper)
    : config_(std::move(config)),
      market_data_(market_data),
      provider_(std::move(provider)),
      persistence_(persistence),
      sleeper_(std::move(sleeper)),
      wall_clock_(wall_clock != nullptr ? *wall_clock : live_clock_) {
  if (!provider_) {
    throw InvalidConfiguration("SimulationEngine requires a decision provider");
  }

  // Internal bus → notification loop. Installed once; the loop is started
  // and stopped per run.
  bus_.subscribe([this](const Event& event) { notifications_.push(event); });
}

SimulationEngine::~SimulationEngine() { stopServices(); }

void SimulationEngine::cancel() {
  if (!cancel_requested_.exchange(true)) {
    std::cout << "[SimulationEngine] cancellation requested.\n";
  }
}

void SimulationEngine::setCompletionHook(CompletionHook hook) {
  completion_hook_ = std::move(hook);
}

// -----------------------------------------------------------------------------
// run()
// -----------------------------------------------------------------------------
domain::BacktestResult SimulationEngine::run() {
  // --- 1) Reject bad configuration before anything is created ---------------
  validate(config_);

  if (running_.exchange(true)) {
    throw BacktestError("SimulationEngine::run() is already in progress");
  }
  cancel_requested_.store(false);

  domain::BacktestResult result;
  result.run_id = config_.run_id;
  result.initial_capital = config_.initial_capital;
  result.started_at = ms_to_timestamp(wall_clock_.now_ms());

  const std::vector<Timestamp> calendar =
      tradingCalendar(config_.start_date, config_.end_date);
  days_done_.store(0);
  days_total_.store(static_cast<int>(calendar.size()));

  try {
    // --- 2) Fresh components, then the threads that observe them ------------
    buildComponents();
    startServices();

    std::cout << "[SimulationEngine] started. run_id=" << config_.run_id
              << " symbols=" << config_.symbols.size()
              << " weekdays=" << calendar.size()
              << " symbol_concurrency=" << config_.symbol_concurrency << "\n";
    publishProgress("started", config_.start_date);

    // --- 3) Calendar loop ---------------------------------------------------
    for (Timestamp date : calendar) {
      if (cancel_requested_.load()) {
        result.cancelled = true;
        break;
      }
      runDay(date, result);
      ++days_done_;
      publishProgress("day", date);
    }
    if (cancel_requested_.load()) {
      result.cancelled = true;
    }

    // --- 4) Collect ---------------------------------------------------------
    result.final_state = positions_->snapshot();
    result.transactions = positions_->transactions();
    result.equity_curve = positions_->equityCurve();
    result.closed_positions = positions_->closedPositions();
    result.finished_at = ms_to_timestamp(wall_clock_.now_ms());

    publishProgress(result.cancelled ? "cancelled" : "finished",
                    ms_to_timestamp(sim_clock_.now_ms()));
  } catch (const std::exception& e) {
    std::cerr << "[SimulationEngine] ERROR: run aborted: " << e.what() << "\n";
    stopServices();
    running_.store(false);
    throw;
  }

  stopServices();
  running_.store(false);

  std::cout << "[SimulationEngine] "
            << (result.cancelled ? "cancelled" : "finished") << ". days="
            << result.trading_days << " decisions=" << result.decisions.size()
            << " transactions=" << result.transactions.size()
            << " final_value=" << result.final_state.total_value << "\n";

  if (completion_hook_) {
    try {
      completion_hook_(result);
    } catch (const std::exception& e) {
      std::cerr << "[SimulationEngine] WARNING: completion hook threw: "
                << e.what() << "\n";
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// buildComponents(): one PositionManager / MemoryStore / orchestrator per run
// -----------------------------------------------------------------------------
void SimulationEngine::buildComponents() {
  std::unique_lock lock(components_mutex_);

  // Dependents first: the orchestrator references the other two.
  symbol_pool_.reset();
  orchestrator_.reset();

  positions_ = std::make_unique<PositionManager>(
      config_.position, config_.initial_capital, &bus_);
  memory_ = std::make_unique<MemoryStore>(
      config_.orchestrator.price_history_capacity,
      config_.orchestrator.agent_memory_capacity);
  orchestrator_ = std::make_unique<DecisionOrchestrator>(
      config_, provider_, wall_clock_, *positions_, *memory_, &bus_,
      sleeper_);

  if (config_.symbol_concurrency > 1) {
    symbol_pool_ = std::make_unique<WorkerPool>(
        static_cast<std::size_t>(config_.symbol_concurrency), "symbols");
  }
}

// -----------------------------------------------------------------------------
// startServices(): notification loop, then IPC when both endpoints are set
// -----------------------------------------------------------------------------
void SimulationEngine::startServices() {
  notifications_.start();

  if (config_.ipc.cmd_endpoint.empty() || config_.ipc.pub_endpoint.empty()) {
    return;
  }

  ipc_server_ = std::make_unique<IpcServer>(
      [this](const std::string& cmd) { return executeCommand(cmd); },
      config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint);
  ipc_server_->start();

  telemetry_subscription_ = notifications_.eventBus().subscribe(
      [this](const Event& event) { ipc_server_->pushTelemetry(event); });
}

// -----------------------------------------------------------------------------
// stopServices(): reverse order. The loop drains into the telemetry queue
// before the IPC server flushes it and closes its sockets.
// -----------------------------------------------------------------------------
void SimulationEngine::stopServices() {
  notifications_.stop();

  if (telemetry_subscription_) {
    notifications_.eventBus().unsubscribe(*telemetry_subscription_);
    telemetry_subscription_.reset();
  }
  if (ipc_server_) {
    ipc_server_->stop();
    ipc_server_.reset();
  }
}

// -----------------------------------------------------------------------------
// runDay(): one simulated weekday
// -----------------------------------------------------------------------------
void SimulationEngine::runDay(Timestamp date, domain::BacktestResult& result) {
  sim_clock_.advance_time(timestamp_to_ms(date));

  std::vector<domain::MarketSnapshot> snapshots;
  std::map<std::string, double> prices;
  for (const auto& symbol : config_.symbols) {
    auto snapshot = market_data_.get(symbol, date);
    if (!snapshot) {
      continue;
    }
    prices[symbol] = snapshot->close;
    snapshots.push_back(std::move(*snapshot));
  }
  if (snapshots.empty()) {
    if (config_.debug) {
      std::cout << "[SimulationEngine] " << format_date(date)
                << ": no market data, skipped\n";
    }
    return;
  }
  ++result.trading_days;

  positions_->markToMarket(prices);

  // --- Decision cycles -------------------------------------------------------
  if (!symbol_pool_) {
    for (const auto& snapshot : snapshots) {
      record(orchestrator_->runCycle(snapshot, cancel_requested_), result,
             true);
    }
  } else {
    // Every cycle of the day sees and is sized against the same opening
    // portfolio; execution happens afterwards on this thread, in configured
    // symbol order, so a later symbol can find the cash already spent and
    // be recorded as REJECTED.
    const domain::PortfolioState opening = positions_->snapshot();
    std::vector<std::future<PendingDecision>> pending;
    pending.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
      pending.push_back(symbol_pool_->submit([this, &snapshot, &opening] {
        return orchestrator_->decide(snapshot, opening, cancel_requested_);
      }));
    }

    // Collect all futures before executing so no task still references the
    // snapshots if one of them throws.
    std::vector<PendingDecision> decided;
    decided.reserve(pending.size());
    std::exception_ptr failure;
    for (auto& f : pending) {
      try {
        decided.push_back(f.get());
      } catch (const std::exception& e) {
        std::cerr << "[SimulationEngine] ERROR: decision cycle failed: "
                  << e.what() << "\n";
        if (!failure) {
          failure = std::current_exception();
        }
      }
    }
    if (failure) {
      std::rethrow_exception(failure);
    }
    for (auto& d : decided) {
      record(orchestrator_->execute(std::move(d)), result, true);
    }
  }

  // --- Forced exits ----------------------------------------------------------
  positions_->markToMarket(prices);
  for (const auto& exit_result : positions_->checkExits(prices, date)) {
    if (!exit_result.committed()) {
      std::cerr << "[SimulationEngine] WARNING: forced exit not committed: "
                << exit_result.reason << "\n";
      continue;
    }
    const auto& tx = exit_result.transaction;

    domain::DecisionRecord exit_record;
    exit_record.decision.id = tx.decision_id;
    exit_record.decision.timestamp = date;
    exit_record.decision.action = domain::TradeAction::Sell;
    exit_record.decision.symbol = tx.symbol;
    exit_record.decision.quantity = tx.quantity;
    exit_record.decision.confidence = 1.0;
    exit_record.decision.rationale = "forced exit";
    exit_record.outcome = domain::ExecutionOutcome::Filled;
    exit_record.transaction = tx;
    exit_record.reason = "forced exit";
    record(std::move(exit_record), result, false);
  }

  // --- End of day -------------------------------------------------------------
  positions_->recordSnapshot(date);
  if (auto violation = positions_->checkInvariants()) {
    std::cerr << "[SimulationEngine] ERROR: portfolio invariant violated on "
              << format_date(date) << ": " << *violation << "\n";
    throw BacktestError("portfolio invariant violated: " + *violation);
  }
}

// -----------------------------------------------------------------------------
// record(): audit trail, risk snapshots, persistence
// -----------------------------------------------------------------------------
void SimulationEngine::record(domain::DecisionRecord record,
                              domain::BacktestResult& result,
                              bool with_risk) {
  if (with_risk && record.outcome != domain::ExecutionOutcome::Cancelled) {
    result.risk_snapshots.push_back(record.risk_metrics);
  }
  if (record.outcome == domain::ExecutionOutcome::Filled &&
      record.transaction) {
    persist(record.decision, *record.transaction);
  }
  result.decisions.push_back(std::move(record));
}

void SimulationEngine::persist(const domain::TradingDecision& decision,
                               const domain::Transaction& transaction) {
  if (persistence_ == nullptr) {
    return;
  }
  domain::AuditRecord audit{decision, transaction,
                            ms_to_timestamp(wall_clock_.now_ms())};
  try {
    persistence_->save(transaction.symbol, audit);
  } catch (const std::exception& e) {
    // A committed trade stays committed.
    std::cerr << "[SimulationEngine] WARNING: persistence failed for "
              << transaction.symbol << " tx=" << transaction.id << ": "
              << e.what() << "\n";
  }
}

void SimulationEngine::publishProgress(const std::string& phase,
                                       Timestamp date) {
  RunProgressEvent event;
  event.run_id = config_.run_id;
  event.phase = phase;
  event.simulated_date = date;
  event.days_done = days_done_.load();
  event.days_total = days_total_.load();
  event.timestamp = ms_to_timestamp(wall_clock_.now_ms());
  event.sequence_id = progress_sequence_.next_id();
  bus_.publish(event);
}

std::vector<Timestamp> SimulationEngine::tradingCalendar(Timestamp start,
                                                         Timestamp end) {
  std::vector<Timestamp> days;
  const Timestamp last = start_of_day(end);
  for (Timestamp day = start_of_day(start); day <= last;
       day = add_days(day, 1)) {
    if (!is_weekend(day)) {
      days.push_back(day);
    }
  }
  return days;
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command handler
// -----------------------------------------------------------------------------
std::string SimulationEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["run_id"] = config_.run_id;
    response["running"] = running_.load();
    response["cancel_requested"] = cancel_requested_.load();

    const std::int64_t sim_ms = sim_clock_.now_ms();
    response["simulated_date"] =
        sim_ms == 0 ? std::string() : format_date(ms_to_timestamp(sim_ms));
    response["days_done"] = days_done_.load();
    response["days_total"] = days_total_.load();

    std::shared_lock lock(components_mutex_);
    nlohmann::json positions_json = nlohmann::json::array();
    if (positions_) {
      const domain::PortfolioState state = positions_->snapshot();
      response["cash"] = state.cash;
      response["total_value"] = state.total_value;
      for (const auto& [symbol, pos] : state.positions) {
        nlohmann::json p;
        p["symbol"] = symbol;
        p["quantity"] = pos.quantity;
        p["entry_price"] = pos.entry_price;
        p["last_price"] = pos.last_price;
        p["unrealized_pnl"] = pos.unrealizedPnl(pos.last_price);
        positions_json.push_back(std::move(p));
      }
    }
    response["positions"] = std::move(positions_json);

    nlohmann::json channels = nlohmann::json::array();
    if (orchestrator_) {
      for (const auto& status : orchestrator_->channelStatuses()) {
        nlohmann::json c;
        c["channel"] = status.channel;
        c["state"] = status.state;
        c["consecutive_failures"] = status.consecutive_failures;
        c["rejected_calls"] = status.rejected_calls;
        channels.push_back(std::move(c));
      }
      if (auto stats = orchestrator_->cacheStats()) {
        nlohmann::json cache;
        cache["hits"] = stats->hits;
        cache["misses"] = stats->misses;
        cache["evictions"] = stats->evictions;
        cache["expirations"] = stats->expirations;
        cache["size"] = stats->size;
        cache["hit_rate"] = stats->hitRate();
        response["cache"] = std::move(cache);
      }
    }
    response["channels"] = std::move(channels);
  } else if (cmd == "CANCEL") {
    cancel();
    response["status"] = "ok";
    response["response"] = "Cancellation requested";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace backtest
