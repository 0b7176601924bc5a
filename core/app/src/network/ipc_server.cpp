#include "backtest/network/ipc_server.hpp"

#include "backtest/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace backtest {

namespace {

std::string formatDecision(const DecisionEvent& e) {
  nlohmann::json j;
  j["type"] = "decision";
  j["sequence_id"] = e.sequence_id;
  j["decision_id"] = e.decision.id;
  j["symbol"] = e.decision.symbol;
  j["date"] = format_date(e.decision.timestamp);
  j["action"] = domain::to_string(e.decision.action);
  j["outcome"] = domain::to_string(e.outcome);
  j["confidence"] = e.decision.confidence;
  j["stance"] = domain::to_string(e.decision.risk.stance);
  j["quantity"] = e.decision.quantity;
  return j.dump();
}

std::string formatTransaction(const TransactionEvent& e) {
  nlohmann::json j;
  j["type"] = "transaction";
  j["sequence_id"] = e.sequence_id;
  j["id"] = e.transaction.id;
  j["symbol"] = e.transaction.symbol;
  j["date"] = format_date(e.transaction.timestamp);
  j["action"] = domain::to_string(e.transaction.action);
  j["quantity"] = e.transaction.quantity;
  j["fill_price"] = e.transaction.fill_price;
  j["commission"] = e.transaction.commission;
  j["slippage"] = e.transaction.slippage;
  j["total_cost"] = e.transaction.total_cost;
  j["realized_pnl"] = e.transaction.realized_pnl;
  j["cash_after"] = e.cash_after;
  return j.dump();
}

std::string formatPortfolio(const PortfolioUpdateEvent& e) {
  nlohmann::json j;
  j["type"] = "portfolio";
  j["sequence_id"] = e.sequence_id;
  j["date"] = format_date(e.snapshot.date);
  j["cash"] = e.snapshot.cash;
  j["positions_value"] = e.snapshot.positions_value;
  j["total_value"] = e.snapshot.total_value;
  j["open_positions"] = e.snapshot.open_positions;
  return j.dump();
}

std::string formatRiskAlert(const RiskAlertEvent& e) {
  nlohmann::json j;
  j["type"] = "risk_alert";
  j["sequence_id"] = e.sequence_id;
  j["symbol"] = e.symbol;
  j["date"] = format_date(e.timestamp);
  j["risk_score"] = e.risk_score;
  j["threshold"] = e.threshold;
  j["advisories"] = e.advisories;
  return j.dump();
}

std::string formatProgress(const RunProgressEvent& e) {
  nlohmann::json j;
  j["type"] = "progress";
  j["sequence_id"] = e.sequence_id;
  j["run_id"] = e.run_id;
  j["phase"] = e.phase;
  j["date"] = format_date(e.simulated_date);
  j["days_done"] = e.days_done;
  j["days_total"] = e.days_total;
  return j.dump();
}

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto text = formatTelemetry(*event);
    if (!text) {
      continue;
    }
    zmq::message_t msg(text->data(), text->size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] WARNING: telemetry dropped (PUB would "
                   "block)\n";
    }
  }
}

void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string response = command_handler_(request.to_string());
  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  if (const auto* e = std::get_if<DecisionEvent>(&event)) {
    return formatDecision(*e);
  }
  if (const auto* e = std::get_if<TransactionEvent>(&event)) {
    return formatTransaction(*e);
  }
  if (const auto* e = std::get_if<PortfolioUpdateEvent>(&event)) {
    return formatPortfolio(*e);
  }
  if (const auto* e = std::get_if<RiskAlertEvent>(&event)) {
    return formatRiskAlert(*e);
  }
  if (const auto* e = std::get_if<RunProgressEvent>(&event)) {
    return formatProgress(*e);
  }
  return std::nullopt;
}

}  // namespace backtest
