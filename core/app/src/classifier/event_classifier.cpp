#include "copier/classifier/event_classifier.hpp"

#include <cmath>
#include <iostream>

namespace copier {

EventClassifier::EventClassifier(domain::AccountId master_account_id)
    : master_account_id_(master_account_id) {}

bool EventClassifier::isPositionImpacting(ExecutionEventKind kind) {
  switch (kind) {
    case ExecutionEventKind::OrderFilled:
    case ExecutionEventKind::OrderPartiallyFilled:
    case ExecutionEventKind::PositionClosed:
      return true;
    default:
      return false;
  }
}

// -----------------------------------------------------------------------------
// classify()
// -----------------------------------------------------------------------------
CopyDecision EventClassifier::classify(const ExecutionEvent& event,
                                       const PositionLedger& ledger) {
  CopyDecision decision;
  decision.instrument_id = event.instrument_id;
  decision.master_position_id = event.master_position_id;
  decision.side = event.side;
  decision.master_volume = event.resulting_master_volume;
  decision.opened_at_ms = event.timestamp_ms;
  decision.sequence_no = event.sequence_no;

  if (event.account_id != master_account_id_) {
    decision.reason = DecisionReason::ForeignAccount;
    return decision;
  }

  if (!acceptSequence(event.instrument_id, event.sequence_no)) {
    decision.reason = DecisionReason::Duplicate;
    return decision;
  }

  if (!isPositionImpacting(event.event_kind)) {
    decision.reason = DecisionReason::NotPositionImpacting;
    return decision;
  }

  const bool closes_fully =
      event.event_kind == ExecutionEventKind::PositionClosed ||
      event.resulting_master_volume <= domain::kVolumeEpsilon;

  auto existing = ledger.find(event.master_position_id);

  if (!existing) {
    // Only a fill that takes the position from zero opens it. Anything else
    // means the position was never mirrored, and reconciliation decides.
    const bool opens_from_zero =
        !closes_fully && !event.closing &&
        std::abs(event.volume_delta - event.resulting_master_volume) <=
            domain::kVolumeEpsilon;
    if (opens_from_zero) {
      decision.action = CopyAction::Open;
      return decision;
    }
    if (!closes_fully) {
      std::cerr << "[EventClassifier] WARNING: master position="
                << event.master_position_id
                << " changed volume but is not in the ledger; delta="
                << event.volume_delta
                << " resulting=" << event.resulting_master_volume << "\n";
    }
    decision.action = CopyAction::Close;
    decision.reason = DecisionReason::UnknownPosition;
    decision.master_volume = 0.0;
    return decision;
  }

  // Keep the side and open time the position was recorded with.
  decision.side = existing->side;
  decision.opened_at_ms = existing->opened_at_ms;

  if (closes_fully) {
    decision.action = CopyAction::Close;
    decision.master_volume = 0.0;
    return decision;
  }

  const domain::Volume previous = existing->master_volume;
  const domain::Volume resulting = event.resulting_master_volume;

  if (resulting < previous - domain::kVolumeEpsilon) {
    decision.action = CopyAction::Adjust;
    decision.requested_slave_volume =
        previous > 0.0 ? resulting / previous * existing->slave_volume : 0.0;
    return decision;
  }

  if (resulting > previous + domain::kVolumeEpsilon) {
    decision.reason = DecisionReason::VolumeIncrease;
    std::cerr << "[EventClassifier] WARNING: master position="
              << event.master_position_id << " grew from " << previous
              << " to " << resulting << "; increases are not mirrored.\n";
    return decision;
  }

  decision.reason = DecisionReason::NoVolumeChange;
  return decision;
}

void EventClassifier::resetSequences() {
  std::lock_guard lock(sequence_mutex_);
  last_sequence_.clear();
}

bool EventClassifier::acceptSequence(domain::InstrumentId instrument_id,
                                     std::uint64_t sequence_no) {
  std::lock_guard lock(sequence_mutex_);
  auto [it, inserted] = last_sequence_.try_emplace(instrument_id, sequence_no);
  if (inserted) {
    return true;
  }
  if (sequence_no <= it->second) {
    return false;
  }
  it->second = sequence_no;
  return true;
}

}  // namespace copier
