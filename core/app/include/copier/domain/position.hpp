#pragma once

#include "copier/domain/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace copier {
namespace domain {

// A mirrored master/slave position pair as recorded in the PositionLedger.
struct Position {
  InstrumentId instrument_id{0};        // Master-side instrument id
  InstrumentId slave_instrument_id{0};  // Resolved slave-side instrument id
  PositionId master_position_id{0};
  std::optional<PositionId> slave_position_id;  // Empty until the open fills
  Side side{Side::Long};
  Volume master_volume{0.0};
  Volume slave_volume{0.0};
  std::int64_t opened_at_ms{0};         // Master open time, epoch ms
};

// A live position as reported by a venue position query. Used only as input
// to reconciliation; it carries no pairing information of its own.
struct LivePosition {
  PositionId position_id{0};
  InstrumentId instrument_id{0};
  Side side{Side::Long};
  Volume volume{0.0};
  std::int64_t opened_at_ms{0};
  std::string label;                    // Order label/comment, may be empty
};

}  // namespace domain
}  // namespace copier
