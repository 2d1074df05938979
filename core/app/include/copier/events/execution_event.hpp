#pragma once

#include "copier/domain/types.hpp"

#include <cstdint>

namespace copier {

// Raw execution notification kinds as delivered by the venue.
enum class ExecutionEventKind {
  OrderAccepted,
  OrderFilled,
  OrderPartiallyFilled,
  PositionClosed,
  OrderRejected,
  OrderCancelled,
  OrderExpired,
  OrderReplaced,
  Unknown,
};

inline const char* toString(ExecutionEventKind kind) {
  switch (kind) {
    case ExecutionEventKind::OrderAccepted:        return "ORDER_ACCEPTED";
    case ExecutionEventKind::OrderFilled:          return "ORDER_FILLED";
    case ExecutionEventKind::OrderPartiallyFilled: return "ORDER_PARTIALLY_FILLED";
    case ExecutionEventKind::PositionClosed:       return "POSITION_CLOSED";
    case ExecutionEventKind::OrderRejected:        return "ORDER_REJECTED";
    case ExecutionEventKind::OrderCancelled:       return "ORDER_CANCELLED";
    case ExecutionEventKind::OrderExpired:         return "ORDER_EXPIRED";
    case ExecutionEventKind::OrderReplaced:        return "ORDER_REPLACED";
    case ExecutionEventKind::Unknown:              return "UNKNOWN";
  }
  return "UNKNOWN";
}

// One execution notification from the master account. Immutable once built;
// consumed exactly once by the classifier.
//
// `side` is the side of the position, not of the deal. `closing` marks a
// deal that reduced the position; such a deal never opens one.
struct ExecutionEvent {
  domain::AccountId account_id{0};
  domain::PositionId master_position_id{0};
  domain::InstrumentId instrument_id{0};
  ExecutionEventKind event_kind{ExecutionEventKind::Unknown};
  domain::Side side{domain::Side::Long};
  domain::Volume volume_delta{0.0};
  domain::Volume resulting_master_volume{0.0};
  bool closing{false};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_no{0};
};

}  // namespace copier
