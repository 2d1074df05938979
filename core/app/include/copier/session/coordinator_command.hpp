#pragma once

#include "copier/domain/order_request.hpp"
#include "copier/session/i_transport.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <variant>

namespace copier {

// Messages consumed by the SessionCoordinator thread. Everything that has to
// touch the transport arrives as one of these.

struct InboundNotification {
  std::uint64_t epoch{0};  // Connection epoch the transport delivered it in
  TransportNotification notification;
};

struct OrderSubmission {
  domain::AccountId account_id{0};
  domain::OrderRequest request;
  std::chrono::steady_clock::time_point submitted_at;
  std::shared_ptr<std::promise<domain::OrderOutcome>> promise;
};

struct BalanceQuery {
  domain::AccountId account_id{0};
  std::shared_ptr<std::promise<std::optional<double>>> promise;
};

struct ReconcileCommand {};

using CoordinatorCommand = std::variant<InboundNotification, OrderSubmission,
                                        BalanceQuery, ReconcileCommand>;

}  // namespace copier
