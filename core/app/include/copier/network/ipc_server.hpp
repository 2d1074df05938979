#pragma once

#include "copier/concurrent/thread_safe_queue.hpp"
#include "copier/events/dispatch_report_event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace copier {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ diagnostics: commands on REP, telemetry on PUB
// -----------------------------------------------------------------------------
//
// @brief  Dedicated thread serving operator commands and broadcasting one
//         JSON message per dispatch report.
//
// @details
//   1. PUB socket (default port 5557): every DispatchReportEvent pushed via
//      pushTelemetry() is published as
//        {"type":"dispatch_report","action":"OPEN","reason":"NONE",
//         "master_position_id":..,"instrument_id":..,"accepted":true,
//         "error":"None","message":"","slave_volume":0.05,"attempts":1}
//      Reports arrive on worker threads; the queue keeps JSON formatting and
//      socket I/O off them.
//
//   2. REP socket (default port 5556): each request string is passed to the
//      command handler (CopierEngine::executeCommand) and its JSON answer is
//      sent back. ZMQ_RCVTIMEO keeps the loop alternating between commands
//      and telemetry.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the IPC thread.
//
// Ownership:
//   Owned by CopierEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the thread. A bind failure is logged and
  // leaves the server stopped; returns whether the server is running.
  bool start();

  // Publishes what is still queued, then joins. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  void pushTelemetry(DispatchReportEvent report);

  static std::string formatDispatchReport(const DispatchReportEvent& report);

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

  ThreadSafeQueue<DispatchReportEvent> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace copier
