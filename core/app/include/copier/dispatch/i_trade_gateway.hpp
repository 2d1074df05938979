#pragma once

#include "copier/domain/order_request.hpp"
#include "copier/domain/types.hpp"

#include <future>
#include <optional>

namespace copier {

// -----------------------------------------------------------------------------
// ITradeGateway: the dispatcher's only path to the venue
// -----------------------------------------------------------------------------
//
// @brief  Submits order requests and account queries on behalf of the
//         OrderDispatcher and delivers the answers as futures.
//
// @details
// The production implementation is SessionCoordinator: a call enqueues a
// message for the coordinator thread, which is the only thread that writes
// to the transport. Tests substitute a scripted fake.
//
// Contract:
//   - The returned future is always eventually satisfied (with an outcome
//     carrying an ErrorKind when the request could not be delivered).
//   - Callers bound their wait with future::wait_for().
//
// Thread model: Both methods may be called concurrently from any worker.
// -----------------------------------------------------------------------------
class ITradeGateway {
 public:
  virtual ~ITradeGateway() = default;

  virtual std::future<domain::OrderOutcome> submitOrder(
      domain::AccountId account_id, const domain::OrderRequest& request) = 0;

  // Account balance in deposit currency, std::nullopt if unavailable.
  virtual std::future<std::optional<double>> requestBalance(
      domain::AccountId account_id) = 0;
};

}  // namespace copier
