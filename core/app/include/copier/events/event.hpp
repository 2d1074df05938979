#pragma once

#include "copier/events/copy_decision.hpp"
#include "copier/events/dispatch_report_event.hpp"
#include "copier/events/execution_event.hpp"

#include <type_traits>
#include <variant>

namespace copier {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The envelope carried by every worker queue and EventBus. A worker receives
// ExecutionEvents from the session layer, turns each into a CopyDecision, and
// reports the dispatch result as a DispatchReportEvent, all on its own bus.
// -----------------------------------------------------------------------------
using Event = std::variant<
    ExecutionEvent,
    CopyDecision,
    DispatchReportEvent>;

// Instrument an event belongs to; used to route it to its worker.
inline domain::InstrumentId instrumentOf(const Event& event) {
  return std::visit(
      [](const auto& e) -> domain::InstrumentId {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, DispatchReportEvent>) {
          return e.decision.instrument_id;
        } else {
          return e.instrument_id;
        }
      },
      event);
}

}  // namespace copier
