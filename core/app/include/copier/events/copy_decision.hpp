#pragma once

#include "copier/domain/types.hpp"

#include <cstdint>

namespace copier {

enum class CopyAction { Open, Close, Adjust, Skip };

enum class DecisionReason {
  None,
  Duplicate,
  NotPositionImpacting,
  ForeignAccount,
  UnknownPosition,
  NoVolumeChange,
  VolumeIncrease,
  Reconciliation,  // OPEN emitted for an unpaired master position
};

inline const char* toString(CopyAction action) {
  switch (action) {
    case CopyAction::Open:   return "OPEN";
    case CopyAction::Close:  return "CLOSE";
    case CopyAction::Adjust: return "ADJUST";
    case CopyAction::Skip:   return "SKIP";
  }
  return "UNKNOWN";
}

inline const char* toString(DecisionReason reason) {
  switch (reason) {
    case DecisionReason::None:                 return "NONE";
    case DecisionReason::Duplicate:            return "DUPLICATE";
    case DecisionReason::NotPositionImpacting: return "NOT_POSITION_IMPACTING";
    case DecisionReason::ForeignAccount:       return "FOREIGN_ACCOUNT";
    case DecisionReason::UnknownPosition:      return "UNKNOWN_POSITION";
    case DecisionReason::NoVolumeChange:       return "NO_VOLUME_CHANGE";
    case DecisionReason::VolumeIncrease:       return "VOLUME_INCREASE";
    case DecisionReason::Reconciliation:       return "RECONCILIATION";
  }
  return "UNKNOWN";
}

// Output of the classifier, input to the dispatcher.
//
// requested_slave_volume is filled in for ADJUST only; OPEN volumes are sized
// by the dispatcher at send time, CLOSE always closes the full slave volume.
struct CopyDecision {
  CopyAction action{CopyAction::Skip};
  DecisionReason reason{DecisionReason::None};
  domain::InstrumentId instrument_id{0};
  domain::PositionId master_position_id{0};
  domain::Side side{domain::Side::Long};
  domain::Volume master_volume{0.0};
  domain::Volume requested_slave_volume{0.0};
  std::int64_t opened_at_ms{0};
  std::uint64_t sequence_no{0};
};

}  // namespace copier
