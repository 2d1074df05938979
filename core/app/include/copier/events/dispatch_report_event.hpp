#pragma once

#include "copier/domain/order_request.hpp"
#include "copier/events/copy_decision.hpp"

namespace copier {

// Published on a worker's bus after every dispatch, including SKIPs. The
// engine forwards these to telemetry and counters.
struct DispatchReportEvent {
  CopyDecision decision;
  domain::OrderOutcome outcome;
  domain::Volume slave_volume{0.0};  // Volume actually requested, 0 if none
  std::uint32_t attempts{0};
};

}  // namespace copier
