#pragma once

#include "backtest/concurrent/thread_safe_queue.hpp"
#include "backtest/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace backtest {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ run control and telemetry for a running backtest
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving two sockets: a REP socket that answers
//         PING / STATUS / CANCEL, and a PUB socket that broadcasts engine
//         events as JSON.
//
// @details
// Commands are forwarded verbatim to the handler (bound to
// SimulationEngine::executeCommand()) and its reply is sent back.
//
// Telemetry arrives through pushTelemetry() from the engine's notification
// thread and is buffered in a ThreadSafeQueue, so formatting and socket I/O
// never run on the simulation thread. Published message shapes:
//
//   {"type":"decision", "decision_id", "symbol", "date", "action",
//    "outcome", "confidence", "stance", "quantity"}
//   {"type":"transaction", "id", "symbol", "action", "quantity",
//    "fill_price", "commission", "slippage", "total_cost", "cash_after"}
//   {"type":"portfolio", "date", "cash", "positions_value", "total_value",
//    "open_positions"}
//   {"type":"risk_alert", "symbol", "risk_score", "threshold", "advisories"}
//   {"type":"progress", "run_id", "phase", "date", "days_done",
//    "days_total"}
//
// Thread model:
//   start()/stop() from the owning thread. The REP socket has a 50 ms
//   receive timeout so the loop alternates between draining telemetry and
//   answering commands, and notices stop() within one timeout.
//
// Ownership:
//   Owned by SimulationEngine via std::unique_ptr, and only constructed when
//   both endpoints are configured. Owns the ZMQ context, the sockets, the
//   telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent.
  // @throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Publishes what is still queued, then joins. Idempotent.
  void stop();

  // Safe from any thread.
  void pushTelemetry(Event event);

  // Pure; exposed for tests. Nullopt for events that are not telemetry.
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace backtest
