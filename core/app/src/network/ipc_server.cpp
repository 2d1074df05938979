#include "copier/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <utility>

namespace copier {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
bool IpcServer::start() {
  if (running_.load()) {
    return true;
  }

  try {
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
  } catch (const zmq::error_t& e) {
    std::cerr << "[IpcServer] bind failed: " << e.what()
              << " CMD=" << cmd_endpoint_ << " PUB=" << pub_endpoint_ << "\n";
    cmd_socket_.reset();
    pub_socket_.reset();
    context_.reset();
    return false;
  }

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
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

void IpcServer::pushTelemetry(DispatchReportEvent report) {
  telemetry_queue_.push(std::move(report));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }

  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto report = telemetry_queue_.try_pop()) {
    const auto json_str = formatDispatchReport(*report);
    zmq::message_t msg(json_str.data(), json_str.size());
    if (!pub_socket_->send(msg, zmq::send_flags::dontwait)) {
      std::cerr << "[IpcServer] telemetry dropped: master_position_id="
                << report->decision.master_position_id << "\n";
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

std::string IpcServer::formatDispatchReport(const DispatchReportEvent& report) {
  nlohmann::json j;
  j["type"] = "dispatch_report";
  j["action"] = toString(report.decision.action);
  j["reason"] = toString(report.decision.reason);
  j["master_position_id"] = report.decision.master_position_id;
  j["instrument_id"] = report.decision.instrument_id;
  j["accepted"] = report.outcome.accepted;
  j["error"] = toString(report.outcome.error_kind);
  j["message"] = report.outcome.message;
  j["slave_volume"] = report.slave_volume;
  j["attempts"] = report.attempts;
  if (report.outcome.slave_position_id) {
    j["slave_position_id"] = *report.outcome.slave_position_id;
  }
  return j.dump();
}

}  // namespace copier
