#pragma once

#include "copier/domain/position.hpp"
#include "copier/symbols/symbol_mapper.hpp"

#include <cstdint>
#include <vector>

namespace copier {

struct ReconcileSettings {
  std::int64_t open_time_tolerance_ms{60'000};
  double max_volume_ratio{2.0};   // slave/master above this never pairs
  double expected_ratio{0.5};     // Tie-breaker between equally timed pairs
};

struct ReconcileResult {
  std::vector<domain::Position> paired;
  std::vector<domain::LivePosition> unpaired_master;  // Become OPEN decisions
  std::vector<domain::LivePosition> orphan_slave;     // Logged, left alone
  std::size_t label_matches{0};
};

// -----------------------------------------------------------------------------
// LedgerReconciler
// -----------------------------------------------------------------------------
//
// @brief  Pairs live master positions with live slave positions so the
//         PositionLedger can be rebuilt after a (re)connect.
//
// @details
// Two passes:
//   1. Label: a slave position labelled "copier:<id>" pairs with master
//      position <id>. Every slave order the dispatcher sends carries this
//      label.
//   2. Heuristic, for what is left: same mapped instrument, same side, open
//      times within open_time_tolerance_ms, and a slave/master volume ratio
//      in (0, max_volume_ratio]. Among candidates the closest open time
//      wins, then the ratio closest to expected_ratio. Masters are matched
//      oldest first.
//
// Best-effort by nature; results are reported, never fatal.
//
// Thread model: Stateless beyond the mapper reference; safe from any thread.
// -----------------------------------------------------------------------------
class LedgerReconciler {
 public:
  LedgerReconciler(const SymbolMapper& mapper, ReconcileSettings settings);

  ReconcileResult reconcile(
      const std::vector<domain::LivePosition>& master_positions,
      const std::vector<domain::LivePosition>& slave_positions) const;

  const ReconcileSettings& settings() const { return settings_; }

 private:
  const SymbolMapper& mapper_;
  ReconcileSettings settings_;
};

}  // namespace copier
