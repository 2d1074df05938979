#pragma once

#include "copier/concurrent/thread_safe_queue.hpp"
#include "copier/network/bridge_codec.hpp"
#include "copier/session/i_transport.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace copier {

struct BridgeSettings {
  std::string request_endpoint{"tcp://127.0.0.1:5560"};
  std::string notify_endpoint{"tcp://127.0.0.1:5561"};
  std::chrono::milliseconds request_timeout{5000};
  std::chrono::milliseconds heartbeat_timeout{30000};
};

// -----------------------------------------------------------------------------
// ZmqBridgeTransport: ITransport over a ZeroMQ broker bridge
// -----------------------------------------------------------------------------
//
// @brief  Talks to the broker bridge process with correlated JSON requests
//         on a DEALER socket and receives notifications on a SUB socket.
//
// @details
// Sockets are created in connect() and owned by the I/O thread from then on.
// Callers never touch a socket: requests are serialized, queued on
// outbound_, and written by the I/O thread, which also polls both sockets,
// routes responses to the pending handler with the matching id, and forwards
// notifications to the sink.
//
// Every pending request carries a deadline. The I/O thread completes expired
// requests with ErrorKind::Timeout, so a handler always runs exactly once.
//
// The bridge publishes HEARTBEAT at least once per second. When the SUB
// socket stays silent longer than heartbeat_timeout, a single TransportLost
// is delivered.
//
// Thread model:
//   Public methods are called from the SessionCoordinator thread. Response
//   handlers and the sink run on the I/O thread.
//
// Ownership:
//   Owned by SessionCoordinator via std::unique_ptr. Owns the ZMQ context,
//   both sockets and the I/O thread.
// -----------------------------------------------------------------------------
class ZmqBridgeTransport : public ITransport {
 public:
  explicit ZmqBridgeTransport(BridgeSettings settings);
  ~ZmqBridgeTransport() override;

  ZmqBridgeTransport(const ZmqBridgeTransport&) = delete;
  ZmqBridgeTransport& operator=(const ZmqBridgeTransport&) = delete;
  ZmqBridgeTransport(ZmqBridgeTransport&&) = delete;
  ZmqBridgeTransport& operator=(ZmqBridgeTransport&&) = delete;

  void setNotificationSink(NotificationSink sink) override;

  ErrorKind connect(domain::Environment environment) override;

  ErrorKind authenticateApplication(const std::string& client_id,
                                    const std::string& client_secret) override;

  ErrorKind authorizeAccount(domain::AccountId account_id,
                             const std::string& access_token) override;

  ErrorKind subscribeExecutionEvents(domain::AccountId account_id) override;

  ErrorKind subscribeSpots(
      domain::AccountId account_id,
      const std::vector<domain::InstrumentId>& instrument_ids) override;

  void sendOrder(domain::AccountId account_id,
                 const domain::OrderRequest& request,
                 OutcomeCallback on_outcome) override;

  TransportResult<std::vector<domain::LivePosition>> queryOpenPositions(
      domain::AccountId account_id) override;

  TransportResult<double> queryBalance(domain::AccountId account_id) override;

  TransportResult<std::vector<domain::InstrumentSpec>> querySymbols(
      domain::AccountId account_id,
      const std::vector<domain::InstrumentId>& instrument_ids) override;

  void disconnect() override;

 private:
  using ResponseHandler = std::function<void(const bridge::Response&)>;
  using Clock = std::chrono::steady_clock;

  struct Pending {
    ResponseHandler handler;
    Clock::time_point deadline;
  };

  struct Outbound {
    std::uint64_t id;
    std::string frame;
  };

  static constexpr int kPollTimeoutMs = 20;

  void ioLoop();
  void flushOutbound();
  void handleResponse(const std::string& raw);
  void handleNotification(const std::string& raw);
  void expirePending();
  void failAllPending(const std::string& reason);
  void complete(std::uint64_t id, const bridge::Response& response);
  void emit(TransportNotification notification);

  void requestAsync(const std::string& type, const nlohmann::json& payload,
                    ResponseHandler handler);
  bridge::Response request(const std::string& type,
                           const nlohmann::json& payload);
  ErrorKind simpleCall(const std::string& type, const nlohmann::json& payload);

  BridgeSettings settings_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> dealer_;
  std::unique_ptr<zmq::socket_t> sub_;

  ThreadSafeQueue<Outbound> outbound_;

  std::mutex pending_mutex_;
  std::unordered_map<std::uint64_t, Pending> pending_;
  std::atomic<std::uint64_t> next_id_{1};

  std::mutex sink_mutex_;
  NotificationSink sink_;

  std::thread io_thread_;
  std::atomic<bool> running_{false};
  Clock::time_point last_notification_{};
  bool lost_reported_{false};
};

}  // namespace copier
