#pragma once

#include "copier/domain/errors.hpp"
#include "copier/domain/types.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>

namespace copier {
namespace domain {

enum class OrderKind {
  Market,         // New market order on the slave
  ClosePosition,  // Full or partial close of linked_position_id
};

inline const char* toString(OrderKind kind) {
  switch (kind) {
    case OrderKind::Market:        return "MARKET";
    case OrderKind::ClosePosition: return "CLOSE_POSITION";
  }
  return "UNKNOWN";
}

// One outbound request, built once per dispatch attempt.
struct OrderRequest {
  OrderKind kind{OrderKind::Market};
  InstrumentId instrument_id{0};         // Slave-side instrument id
  Side side{Side::Long};
  Volume volume{0.0};
  std::optional<PositionId> linked_position_id;  // Set for ClosePosition
  std::uint32_t attempt_no{1};
  std::string label;                     // "copier:<master_position_id>"
};

struct OrderOutcome {
  bool accepted{false};
  std::optional<PositionId> slave_position_id;
  ErrorKind error_kind{ErrorKind::None};
  std::string message;                   // Venue reason text on rejection
};

// Label stamped on every slave order so reconciliation can pair positions
// after a restart.
inline std::string makeCopyLabel(PositionId master_position_id) {
  return "copier:" + std::to_string(master_position_id);
}

// Labels come from the venue; anything but "copier:" followed by a decimal
// id that fits a PositionId is not ours.
inline std::optional<PositionId> parseCopyLabel(const std::string& label) {
  static const std::string kPrefix = "copier:";
  if (label.size() <= kPrefix.size() ||
      label.compare(0, kPrefix.size(), kPrefix) != 0) {
    return std::nullopt;
  }
  const char* first = label.data() + kPrefix.size();
  const char* last = label.data() + label.size();
  if (*first < '0' || *first > '9') {
    return std::nullopt;
  }
  PositionId id = 0;
  const auto [ptr, ec] = std::from_chars(first, last, id);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return id;
}

}  // namespace domain
}  // namespace copier
