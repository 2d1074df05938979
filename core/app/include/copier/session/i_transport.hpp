#pragma once

#include "copier/domain/errors.hpp"
#include "copier/domain/instrument_spec.hpp"
#include "copier/domain/order_request.hpp"
#include "copier/domain/position.hpp"
#include "copier/domain/types.hpp"
#include "copier/events/execution_event.hpp"
#include "copier/events/spot_event.hpp"

#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace copier {

// Raised by the transport when the connection is gone (heartbeat lost,
// socket error). The coordinator returns to DISCONNECTED on receipt.
struct TransportLost {
  std::string reason;
};

using TransportNotification =
    std::variant<ExecutionEvent, SpotEvent, TransportLost>;

// Result of a synchronous query.
template <typename T>
struct TransportResult {
  ErrorKind error{ErrorKind::None};
  std::string message;
  T value{};

  bool ok() const { return error == ErrorKind::None; }
};

// -----------------------------------------------------------------------------
// ITransport: session transport to the brokerage venue
// -----------------------------------------------------------------------------
//
// @brief  Connection, authentication, subscriptions, order submission and
//         queries against one venue environment.
//
// @details
// Synchronous calls block the caller until the venue answers or the
// implementation's request timeout expires (ErrorKind::Timeout).
//
// Execution, spot and connection-loss notifications are delivered through a
// single sink. sendOrder() is asynchronous: `on_outcome` is invoked exactly
// once, on an implementation thread, when the response for that request's
// correlation id arrives or when the request fails (including disconnect).
//
// Thread model:
//   Single writer. Only SessionCoordinator calls into an ITransport, from
//   its own thread. The sink and outcome callbacks run on the transport's
//   internal thread and must only enqueue.
//
// Ownership:
//   Owned by SessionCoordinator through std::unique_ptr.
// -----------------------------------------------------------------------------
class ITransport {
 public:
  using NotificationSink = std::function<void(TransportNotification)>;
  using OutcomeCallback = std::function<void(domain::OrderOutcome)>;

  virtual ~ITransport() = default;

  // Replaces the sink. Notifications arriving with no sink are discarded.
  virtual void setNotificationSink(NotificationSink sink) = 0;

  virtual ErrorKind connect(domain::Environment environment) = 0;

  virtual ErrorKind authenticateApplication(const std::string& client_id,
                                            const std::string& client_secret) = 0;

  virtual ErrorKind authorizeAccount(domain::AccountId account_id,
                                     const std::string& access_token) = 0;

  virtual ErrorKind subscribeExecutionEvents(domain::AccountId account_id) = 0;

  virtual ErrorKind subscribeSpots(
      domain::AccountId account_id,
      const std::vector<domain::InstrumentId>& instrument_ids) = 0;

  virtual void sendOrder(domain::AccountId account_id,
                         const domain::OrderRequest& request,
                         OutcomeCallback on_outcome) = 0;

  virtual TransportResult<std::vector<domain::LivePosition>> queryOpenPositions(
      domain::AccountId account_id) = 0;

  virtual TransportResult<double> queryBalance(
      domain::AccountId account_id) = 0;

  virtual TransportResult<std::vector<domain::InstrumentSpec>> querySymbols(
      domain::AccountId account_id,
      const std::vector<domain::InstrumentId>& instrument_ids) = 0;

  // Tears the connection down and fails every outstanding request with
  // ErrorKind::Transport. Idempotent.
  virtual void disconnect() = 0;
};

}  // namespace copier
