#include "copier/network/zmq_bridge_transport.hpp"

#include <cerrno>
#include <future>
#include <iostream>
#include <utility>
#include <vector>

namespace copier {

namespace {

bridge::Response failure(std::uint64_t id, ErrorKind error, std::string message) {
  bridge::Response r;
  r.id = id;
  r.ok = false;
  r.error = error;
  r.message = std::move(message);
  return r;
}

}  // namespace

ZmqBridgeTransport::ZmqBridgeTransport(BridgeSettings settings)
    : settings_(std::move(settings)) {}

ZmqBridgeTransport::~ZmqBridgeTransport() { disconnect(); }

void ZmqBridgeTransport::setNotificationSink(NotificationSink sink) {
  std::lock_guard lock(sink_mutex_);
  sink_ = std::move(sink);
}

// -----------------------------------------------------------------------------
// connect(): open sockets, start the I/O thread, handshake with the bridge
// -----------------------------------------------------------------------------
ErrorKind ZmqBridgeTransport::connect(domain::Environment environment) {
  disconnect();

  try {
    context_ = std::make_unique<zmq::context_t>(1);
    dealer_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::dealer);
    sub_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::sub);

    dealer_->set(zmq::sockopt::linger, 0);
    sub_->set(zmq::sockopt::linger, 0);
    sub_->set(zmq::sockopt::subscribe, "");
    dealer_->connect(settings_.request_endpoint);
    sub_->connect(settings_.notify_endpoint);
  } catch (const zmq::error_t& e) {
    std::cerr << "[Bridge] socket setup failed: " << e.what() << "\n";
    dealer_.reset();
    sub_.reset();
    context_.reset();
    return ErrorKind::Transport;
  }

  last_notification_ = Clock::now();
  lost_reported_ = false;
  running_.store(true);
  io_thread_ = std::thread([this] { ioLoop(); });

  std::cout << "[Bridge] connecting. REQ=" << settings_.request_endpoint
            << " SUB=" << settings_.notify_endpoint
            << " env=" << domain::toString(environment) << "\n";

  nlohmann::json payload;
  payload["environment"] = domain::toString(environment);
  return simpleCall("CONNECT", payload);
}

ErrorKind ZmqBridgeTransport::authenticateApplication(
    const std::string& client_id, const std::string& client_secret) {
  nlohmann::json payload;
  payload["client_id"] = client_id;
  payload["client_secret"] = client_secret;
  return simpleCall("APPLICATION_AUTH", payload);
}

ErrorKind ZmqBridgeTransport::authorizeAccount(domain::AccountId account_id,
                                               const std::string& access_token) {
  nlohmann::json payload;
  payload["account_id"] = account_id;
  payload["access_token"] = access_token;
  return simpleCall("ACCOUNT_AUTH", payload);
}

ErrorKind ZmqBridgeTransport::subscribeExecutionEvents(
    domain::AccountId account_id) {
  nlohmann::json payload;
  payload["account_id"] = account_id;
  return simpleCall("SUBSCRIBE_EXECUTION", payload);
}

ErrorKind ZmqBridgeTransport::subscribeSpots(
    domain::AccountId account_id,
    const std::vector<domain::InstrumentId>& instrument_ids) {
  nlohmann::json payload;
  payload["account_id"] = account_id;
  payload["symbol_ids"] = instrument_ids;
  return simpleCall("SUBSCRIBE_SPOTS", payload);
}

void ZmqBridgeTransport::sendOrder(domain::AccountId account_id,
                                   const domain::OrderRequest& request,
                                   OutcomeCallback on_outcome) {
  requestAsync(bridge::requestTypeFor(request),
               bridge::encodeOrder(account_id, request),
               [cb = std::move(on_outcome)](const bridge::Response& r) {
                 cb(bridge::parseOrderOutcome(r));
               });
}

TransportResult<std::vector<domain::LivePosition>>
ZmqBridgeTransport::queryOpenPositions(domain::AccountId account_id) {
  nlohmann::json payload;
  payload["account_id"] = account_id;
  auto response = request("RECONCILE", payload);

  TransportResult<std::vector<domain::LivePosition>> result;
  result.error = response.ok ? ErrorKind::None : response.error;
  result.message = response.message;
  if (!response.ok) {
    return result;
  }
  try {
    result.value = bridge::parsePositions(response.payload);
  } catch (const nlohmann::json::exception& e) {
    result.error = ErrorKind::Transport;
    result.message = std::string("malformed positions: ") + e.what();
  }
  return result;
}

TransportResult<double> ZmqBridgeTransport::queryBalance(
    domain::AccountId account_id) {
  nlohmann::json payload;
  payload["account_id"] = account_id;
  auto response = request("TRADER", payload);

  TransportResult<double> result;
  result.error = response.ok ? ErrorKind::None : response.error;
  result.message = response.message;
  if (!response.ok) {
    return result;
  }
  try {
    result.value = response.payload.at("balance").get<double>();
  } catch (const nlohmann::json::exception& e) {
    result.error = ErrorKind::Transport;
    result.message = std::string("malformed balance: ") + e.what();
  }
  return result;
}

TransportResult<std::vector<domain::InstrumentSpec>>
ZmqBridgeTransport::querySymbols(
    domain::AccountId account_id,
    const std::vector<domain::InstrumentId>& instrument_ids) {
  nlohmann::json payload;
  payload["account_id"] = account_id;
  payload["symbol_ids"] = instrument_ids;
  auto response = request("SYMBOLS", payload);

  TransportResult<std::vector<domain::InstrumentSpec>> result;
  result.error = response.ok ? ErrorKind::None : response.error;
  result.message = response.message;
  if (!response.ok) {
    return result;
  }
  try {
    result.value = bridge::parseSymbols(response.payload);
  } catch (const nlohmann::json::exception& e) {
    result.error = ErrorKind::Transport;
    result.message = std::string("malformed symbols: ") + e.what();
  }
  return result;
}

// -----------------------------------------------------------------------------
// disconnect(): stop the I/O thread, then fail what is still outstanding
// -----------------------------------------------------------------------------
void ZmqBridgeTransport::disconnect() {
  running_.store(false);
  if (io_thread_.joinable()) {
    io_thread_.join();
  }

  failAllPending("disconnected");
  outbound_.drain();

  if (context_) {
    dealer_.reset();
    sub_.reset();
    context_.reset();
    std::cout << "[Bridge] disconnected.\n";
  }
}

// -----------------------------------------------------------------------------
// requestAsync(): register the handler, then queue the frame
// -----------------------------------------------------------------------------
void ZmqBridgeTransport::requestAsync(const std::string& type,
                                      const nlohmann::json& payload,
                                      ResponseHandler handler) {
  const std::uint64_t id = next_id_.fetch_add(1);
  if (!running_.load()) {
    handler(failure(id, ErrorKind::Transport, "not connected"));
    return;
  }
  {
    std::lock_guard lock(pending_mutex_);
    pending_[id] = Pending{std::move(handler),
                           Clock::now() + settings_.request_timeout};
  }
  outbound_.push(Outbound{id, bridge::encodeRequest(id, type, payload)});
}

bridge::Response ZmqBridgeTransport::request(const std::string& type,
                                             const nlohmann::json& payload) {
  auto promise = std::make_shared<std::promise<bridge::Response>>();
  auto future = promise->get_future();
  requestAsync(type, payload,
               [promise](const bridge::Response& r) { promise->set_value(r); });

  // The I/O thread expires the request at its deadline; the extra margin
  // only matters if that thread has died.
  if (future.wait_for(settings_.request_timeout * 2) !=
      std::future_status::ready) {
    return failure(0, ErrorKind::Timeout, type + " timed out");
  }
  return future.get();
}

ErrorKind ZmqBridgeTransport::simpleCall(const std::string& type,
                                         const nlohmann::json& payload) {
  auto response = request(type, payload);
  if (!response.ok) {
    std::cerr << "[Bridge] " << type << " failed: " << toString(response.error)
              << " " << response.message << "\n";
    return response.error;
  }
  return ErrorKind::None;
}

// -----------------------------------------------------------------------------
// ioLoop(): the only code that touches the sockets after connect()
// -----------------------------------------------------------------------------
void ZmqBridgeTransport::ioLoop() {
  while (running_.load()) {
    flushOutbound();

    zmq::pollitem_t items[] = {
        {dealer_->handle(), 0, ZMQ_POLLIN, 0},
        {sub_->handle(), 0, ZMQ_POLLIN, 0},
    };

    try {
      zmq::poll(items, 2, std::chrono::milliseconds(kPollTimeoutMs));

      if (items[0].revents & ZMQ_POLLIN) {
        zmq::message_t msg;
        while (dealer_->recv(msg, zmq::recv_flags::dontwait)) {
          handleResponse(msg.to_string());
        }
      }
      if (items[1].revents & ZMQ_POLLIN) {
        zmq::message_t msg;
        while (sub_->recv(msg, zmq::recv_flags::dontwait)) {
          last_notification_ = Clock::now();
          handleNotification(msg.to_string());
        }
      }
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      std::cerr << "[Bridge] socket error: " << e.what() << "\n";
      running_.store(false);
      emit(TransportLost{e.what()});
      break;
    }

    expirePending();

    if (!lost_reported_ &&
        Clock::now() - last_notification_ > settings_.heartbeat_timeout) {
      lost_reported_ = true;
      std::cerr << "[Bridge] heartbeat lost after "
                << settings_.heartbeat_timeout.count() << "ms\n";
      emit(TransportLost{"heartbeat timeout"});
    }
  }
}

void ZmqBridgeTransport::flushOutbound() {
  while (auto item = outbound_.try_pop()) {
    auto sent = dealer_->send(zmq::buffer(item->frame), zmq::send_flags::dontwait);
    if (!sent.has_value()) {
      complete(item->id,
               failure(item->id, ErrorKind::Transport, "bridge not reachable"));
    }
  }
}

void ZmqBridgeTransport::handleResponse(const std::string& raw) {
  try {
    auto response = bridge::decodeResponse(raw);
    complete(response.id, response);
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[Bridge] bad response: " << e.what() << "\n";
  }
}

void ZmqBridgeTransport::handleNotification(const std::string& raw) {
  try {
    if (auto notification = bridge::decodeNotification(raw)) {
      emit(std::move(*notification));
    }
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[Bridge] bad notification: " << e.what() << "\n";
  }
}

void ZmqBridgeTransport::expirePending() {
  const auto now = Clock::now();
  std::vector<std::uint64_t> expired;
  {
    std::lock_guard lock(pending_mutex_);
    for (const auto& [id, pending] : pending_) {
      if (pending.deadline <= now) {
        expired.push_back(id);
      }
    }
  }
  for (auto id : expired) {
    complete(id, failure(id, ErrorKind::Timeout, "no response from bridge"));
  }
}

void ZmqBridgeTransport::failAllPending(const std::string& reason) {
  std::unordered_map<std::uint64_t, Pending> failed;
  {
    std::lock_guard lock(pending_mutex_);
    failed.swap(pending_);
  }
  for (auto& [id, pending] : failed) {
    pending.handler(failure(id, ErrorKind::Transport, reason));
  }
}

// Handlers run outside the lock so they may issue further requests.
void ZmqBridgeTransport::complete(std::uint64_t id,
                                  const bridge::Response& response) {
  ResponseHandler handler;
  {
    std::lock_guard lock(pending_mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
      return;
    }
    handler = std::move(it->second.handler);
    pending_.erase(it);
  }
  handler(response);
}

void ZmqBridgeTransport::emit(TransportNotification notification) {
  std::lock_guard lock(sink_mutex_);
  if (sink_) {
    sink_(std::move(notification));
  }
}

}  // namespace copier
