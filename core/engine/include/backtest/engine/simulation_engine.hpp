#pragma once

#include "backtest/agents/decision_orchestrator.hpp"
#include "backtest/agents/i_decision_provider.hpp"
#include "backtest/concurrent/event_loop_thread.hpp"
#include "backtest/concurrent/sequence_generator.hpp"
#include "backtest/concurrent/worker_pool.hpp"
#include "backtest/config/backtest_config.hpp"
#include "backtest/data/i_market_data_provider.hpp"
#include "backtest/domain/backtest_result.hpp"
#include "backtest/eventbus/event_bus.hpp"
#include "backtest/memory/memory_store.hpp"
#include "backtest/network/ipc_server.hpp"
#include "backtest/persistence/i_persistence_collaborator.hpp"
#include "backtest/portfolio/position_manager.hpp"
#include "backtest/resilience/resilient_caller.hpp"
#include "backtest/time/live_time_provider.hpp"
#include "backtest/time/simulation_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace backtest {

// -----------------------------------------------------------------------------
// SimulationEngine
// -----------------------------------------------------------------------------
//
// @brief  Drives a backtest over the configured calendar and returns a
//         BacktestResult.
//
// @details
// run() validates the configuration before building anything; an
// InvalidConfiguration is the only exception a caller should expect from
// it. Then, for each weekday in [start_date, end_date]:
//
//   1. Stop if cancel() was requested.
//   2. Advance the simulation clock to the date.
//   3. Fetch one bar per symbol; a date without any bar is not a trading
//      day and is skipped.
//   4. Mark the portfolio to the day's closes.
//   5. Run a decision cycle per symbol. With symbol_concurrency > 1 the
//      phases 1-5 run in parallel on a WorkerPool; phase 6 always runs on
//      this thread in configured symbol order, so PositionManager is never
//      mutated concurrently and results do not depend on scheduling.
//   6. Force exits (stop loss, take profit, max holding).
//   7. Record the daily portfolio snapshot and verify the cash / total
//      value invariants.
//
// Every committed transaction, including forced exits, is passed to the
// IPersistenceCollaborator as {decision, transaction, stored_at}.
//
// Thread layout during run():
//
//   caller thread        → calendar loop, phase 6, persistence
//   orchestrator pool    → phase 2 / phase 4 fan-out
//   symbol pool          → phases 1-5 when symbol_concurrency > 1
//   notification loop    → EventLoopThread re-publishing engine events
//   IPC thread           → IpcServer (only when both endpoints are set)
//
// Components publish on an internal EventBus; a bridge forwards every event
// into the notification loop, whose bus is what eventBus() exposes. A slow
// subscriber therefore delays telemetry, never the simulation.
//
// Time:
//   The simulated date lives in a SimulationTimeProvider. Cache TTLs and
//   circuit-breaker cooldowns measure real elapsed time, so they use the
//   wall clock (LiveTimeProvider unless one is injected).
//
// Ownership:
//   SimulationEngine
//    ├── sim_clock_, live_clock_       (value members)
//    ├── bus_, notifications_          (value members, outlive components)
//    ├── positions_, memory_           (unique_ptr, rebuilt per run)
//    ├── orchestrator_, symbol_pool_   (unique_ptr, rebuilt per run)
//    ├── ipc_server_                   (unique_ptr, alive during run())
//    ├── market_data_                  (non-owning reference)
//    ├── provider_                     (shared with ResilientCaller)
//    └── persistence_                  (optional, non-owning)
//   Components of the last run stay alive after run() returns so callers
//   and STATUS can inspect them.
// -----------------------------------------------------------------------------
class SimulationEngine {
 public:
  using CompletionHook = std::function<void(const domain::BacktestResult&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  //
  // @param  config       Copied. Not validated until run().
  // @param  market_data  Must outlive the engine.
  // @param  provider     Agent backend; must be thread-safe.
  // @param  persistence  Optional audit sink; must outlive the engine.
  // @param  wall_clock   Optional clock for cache TTL and breaker cooldown.
  // @param  sleeper      Optional retry backoff sleeper (tests pass a no-op).
  // -------------------------------------------------------------------------
  SimulationEngine(BacktestConfig config,
                   const IMarketDataProvider& market_data,
                   std::shared_ptr<IDecisionProvider> provider,
                   IPersistenceCollaborator* persistence = nullptr,
                   const ITimeProvider* wall_clock = nullptr,
                   ResilientCaller::Sleeper sleeper = {});

  ~SimulationEngine();

  SimulationEngine(const SimulationEngine&) = delete;
  SimulationEngine& operator=(const SimulationEngine&) = delete;
  SimulationEngine(SimulationEngine&&) = delete;
  SimulationEngine& operator=(SimulationEngine&&) = delete;

  // -------------------------------------------------------------------------
  // run()
  // -------------------------------------------------------------------------
  //
  // @brief  Executes the whole backtest on the calling thread.
  //
  // @return The result, possibly with cancelled == true. A run always
  //         returns a result once the configuration is accepted.
  //
  // @throws InvalidConfiguration before any state is created.
  //         BacktestError if a second run() is started concurrently.
  // -------------------------------------------------------------------------
  domain::BacktestResult run();

  // Requests cancellation; observed between dates and between phases.
  // Safe from any thread, including a signal-forwarding thread.
  void cancel();
  bool cancelRequested() const { return cancel_requested_.load(); }
  bool isRunning() const { return running_.load(); }

  // Invoked with the final result after the run has fully stopped.
  void setCompletionHook(CompletionHook hook);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Answers an IPC command with a JSON document.
  //
  //   PING    {"status":"ok","response":"PONG"}
  //   STATUS  run id, running flag, simulated date, progress, cash, total
  //           value, open positions, channel circuit states, cache stats
  //   CANCEL  requests cancellation
  //
  // Unknown commands get {"status":"error", ...}. Safe from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Bus of the notification loop; subscribers run on that loop's thread.
  EventBus& eventBus() { return notifications_.eventBus(); }

  const BacktestConfig& config() const { return config_; }

  // Components of the current or last run; null before the first run().
  // Not synchronized with run(); inspect after it returns.
  const PositionManager* positionManager() const { return positions_.get(); }
  const DecisionOrchestrator* orchestrator() const {
    return orchestrator_.get();
  }
  const MemoryStore* memory() const { return memory_.get(); }

 private:
  void buildComponents();
  void startServices();
  void stopServices();

  void runDay(Timestamp date, domain::BacktestResult& result);
  void record(domain::DecisionRecord record, domain::BacktestResult& result,
              bool with_risk);
  void persist(const domain::TradingDecision& decision,
               const domain::Transaction& transaction);
  void publishProgress(const std::string& phase, Timestamp date);

  static std::vector<Timestamp> tradingCalendar(Timestamp start,
                                                Timestamp end);

  BacktestConfig config_;
  const IMarketDataProvider& market_data_;
  std::shared_ptr<IDecisionProvider> provider_;
  IPersistenceCollaborator* persistence_;
  ResilientCaller::Sleeper sleeper_;

  LiveTimeProvider live_clock_;
  const ITimeProvider& wall_clock_;
  SimulationTimeProvider sim_clock_;

  EventBus bus_;
  EventLoopThread notifications_;
  std::optional<EventBus::SubscriptionId> telemetry_subscription_;

  // Guards the pointers below against STATUS reads while run() rebuilds
  // them; the components lock their own state.
  mutable std::shared_mutex components_mutex_;
  std::unique_ptr<PositionManager> positions_;
  std::unique_ptr<MemoryStore> memory_;
  std::unique_ptr<DecisionOrchestrator> orchestrator_;
  std::unique_ptr<WorkerPool> symbol_pool_;
  std::unique_ptr<IpcServer> ipc_server_;

  SequenceGenerator progress_sequence_;
  CompletionHook completion_hook_;

  std::atomic<bool> running_{false};
  std::atomic<bool> cancel_requested_{false};
  std::atomic<int> days_done_{0};
  std::atomic<int> days_total_{0};
};

}  // namespace backtest
