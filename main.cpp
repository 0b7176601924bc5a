// -----------------------------------------------------------------------------
// backtest_sim: command-line entry point.
//
// Usage: backtest_sim <config.json>
//
//   1) Load and validate the BacktestConfig (exit code 2 on error).
//   2) Load the market data file named by "market_data".
//   3) Open the JSON-lines audit log named by "audit_log", if any.
//   4) Run the SimulationEngine with the rule-based decision provider.
//      Progress lines are printed from the engine's notification loop.
//   5) Print the run summary as JSON on stdout.
//
// Thread layout:
//   main thread          → SimulationEngine::run()
//   notification thread  → progress / risk alert logging below
//   (plus the engine's worker pools and optional IPC thread)
//
// Ctrl-C requests cancellation; the run stops at the next date or phase
// boundary and the partial summary is still printed.
// -----------------------------------------------------------------------------

#include "backtest/agents/rule_based_decision_provider.hpp"
#include "backtest/config/config_loader.hpp"
#include "backtest/data/json_market_data_provider.hpp"
#include "backtest/engine/simulation_engine.hpp"
#include "backtest/error/errors.hpp"
#include "backtest/events/event_types.hpp"
#include "backtest/persistence/json_audit_log.hpp"
#include "backtest/serialization/record_json.hpp"
#include "backtest/time/time_utils.hpp"

#include <csignal>
#include <iostream>
#include <memory>

// -----------------------------------------------------------------------------
// The SIGINT handler needs the engine, which lives on main()'s stack. Set
// once before the handler is installed and cleared before the engine dies.
// -----------------------------------------------------------------------------
static backtest::SimulationEngine* g_engine_ptr = nullptr;

static void sigint_handler(int /*signum*/) {
  if (g_engine_ptr != nullptr) {
    g_engine_ptr->cancel();
  }
}

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "usage: " << argv[0] << " <config.json>\n";
    return 2;
  }

  backtest::BacktestConfig config;
  try {
    config = backtest::ConfigLoader::fromFile(argv[1]);
  } catch (const backtest::InvalidConfiguration& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 2;
  }
  if (config.market_data_path.empty()) {
    std::cerr << "[main] ERROR: config has no \"market_data\" path\n";
    return 2;
  }

  try {
    const auto market_data =
        backtest::JsonMarketDataProvider::fromFile(config.market_data_path);
    std::cout << "[main] market data: " << market_data.barCount()
              << " bar(s), " << market_data.skippedCount() << " skipped\n";

    std::unique_ptr<backtest::JsonAuditLog> audit_log;
    if (!config.audit_log_path.empty()) {
      audit_log = std::make_unique<backtest::JsonAuditLog>(config.audit_log_path);
    }

    backtest::SimulationEngine engine(
        config, market_data,
        std::make_shared<backtest::RuleBasedDecisionProvider>(),
        audit_log.get());

    engine.eventBus().subscribe<backtest::RunProgressEvent>(
        [](const backtest::RunProgressEvent& e) {
          if (e.phase == "day") {
            std::cout << "[progress] " << backtest::format_date(e.simulated_date)
                      << " " << e.days_done << "/" << e.days_total << "\n";
          }
        });
    engine.eventBus().subscribe<backtest::RiskAlertEvent>(
        [](const backtest::RiskAlertEvent& e) {
          std::cout << "[risk] " << e.symbol << " "
                    << backtest::format_date(e.timestamp)
                    << " score=" << e.risk_score << "\n";
        });

    g_engine_ptr = &engine;
    std::signal(SIGINT, sigint_handler);

    const backtest::domain::BacktestResult result = engine.run();

    std::signal(SIGINT, SIG_DFL);
    g_engine_ptr = nullptr;

    std::cout << backtest::summaryJson(result).dump(2) << "\n";
    return result.cancelled ? 130 : 0;
  } catch (const backtest::InvalidConfiguration& e) {
    g_engine_ptr = nullptr;
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    g_engine_ptr = nullptr;
    std::cerr << "[main] ERROR: run failed: " << e.what() << "\n";
    return 1;
  }
}
