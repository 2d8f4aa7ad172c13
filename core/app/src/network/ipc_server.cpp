#include "credit/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace credit {

namespace {

// std::visit target turning each event alternative into its JSON object.
struct TelemetryFormatter {
  nlohmann::json operator()(const LoanOpenedEvent& e) const {
    nlohmann::json j;
    j["type"] = "loan_opened";
    j["loan_id"] = e.loan_id;
    j["borrower"] = e.borrower;
    j["asset"] = e.asset;
    j["principal"] = e.principal;
    j["origination_fee"] = e.origination_fee;
    j["collateral_asset"] = e.collateral_asset;
    j["collateral_amount"] = e.collateral_amount;
    j["start_ts"] = e.start_ts;
    j["due_ts"] = e.due_ts;
    return j;
  }

  nlohmann::json operator()(const LoanRepaidEvent& e) const {
    nlohmann::json j;
    j["type"] = "loan_repaid";
    j["loan_id"] = e.loan_id;
    j["borrower"] = e.borrower;
    j["paid_net"] = e.paid_net;
    j["refund"] = e.refund;
    j["total_repaid"] = e.total_repaid;
    j["total_debt"] = e.total_debt;
    j["protocol_fee"] = e.protocol_fee;
    j["fully_repaid"] = e.fully_repaid;
    j["timestamp"] = e.timestamp;
    return j;
  }

  nlohmann::json operator()(const LoanDefaultedEvent& e) const {
    nlohmann::json j;
    j["type"] = "loan_defaulted";
    j["loan_id"] = e.loan_id;
    j["borrower"] = e.borrower;
    j["keeper"] = e.keeper;
    j["bounty"] = e.bounty;
    j["collateral_retained"] = e.collateral_retained;
    j["debt_at_default"] = e.debt_at_default;
    j["timestamp"] = e.timestamp;
    return j;
  }

  nlohmann::json operator()(const LedgerPausedEvent& e) const {
    nlohmann::json j;
    j["type"] = e.paused ? "ledger_paused" : "ledger_unpaused";
    j["by"] = e.by;
    j["timestamp"] = e.timestamp;
    return j;
  }
};

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

  // Bounded recv so the loop can observe running_ and drain telemetry.
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
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    std::string payload = formatTelemetry(*maybe_event);
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
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
    return;  // timeout
  }

  std::string cmd = request.to_string();
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

std::string IpcServer::formatTelemetry(const Event& event) {
  return std::visit(TelemetryFormatter{}, event).dump();
}

}  // namespace credit
