#pragma once

#include "copier/domain/errors.hpp"
#include "copier/domain/position.hpp"
#include "copier/domain/types.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace copier {

// -----------------------------------------------------------------------------
// PositionLedger
// -----------------------------------------------------------------------------
//
// @brief  Authoritative in-memory table of open master/slave position pairs,
//         keyed by master_position_id.
//
// @details
// Every mutation reports its outcome as an ErrorKind:
//
//   upsertOpen   DuplicateKey if the master position is already recorded
//   adjust       NotFound if absent
//   remove       NotFound if absent
//
// Entries are created only once the slave open is confirmed, adjusted only
// once a partial close is confirmed, and removed only once the close is
// confirmed. A crash between request and confirmation therefore leaves the
// ledger at the last confirmed state, which the next reconnect reconciles.
//
// Thread model:
//   Shared between all worker threads and the session coordinator. The map
//   is guarded by a shared_mutex (readers: find/snapshot, writers: the
//   mutators). On top of that each key is only ever mutated by the worker
//   that owns its instrument, so two adjustments to one position never race.
//   Full rebuilds (replaceAll) happen while no worker is dispatching against
//   the session, i.e. before the coordinator enters RUNNING.
//
// Ownership:
//   Owned by CopierEngine. Workers and the coordinator hold references.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  PositionLedger() = default;

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // upsertOpen(position)
  // -------------------------------------------------------------------------
  //
  // @brief  Records a newly mirrored position.
  //
  // @return ErrorKind::None, or DuplicateKey when master_position_id is
  //         already present (the existing entry is left untouched).
  // -------------------------------------------------------------------------
  ErrorKind upsertOpen(const domain::Position& position);

  // -------------------------------------------------------------------------
  // adjust(master_position_id, new_master_volume, new_slave_volume)
  // -------------------------------------------------------------------------
  //
  // @brief  Replaces both volumes of an existing entry after a confirmed
  //         partial close.
  //
  // @return ErrorKind::None, or NotFound. Negative volumes are clamped to 0.
  // -------------------------------------------------------------------------
  ErrorKind adjust(domain::PositionId master_position_id,
                   domain::Volume new_master_volume,
                   domain::Volume new_slave_volume);

  // NotFound when absent. Callers needing idempotency use removeIfPresent().
  ErrorKind remove(domain::PositionId master_position_id);

  // Check-then-remove under one lock. Returns the removed entry, if any.
  std::optional<domain::Position> removeIfPresent(
      domain::PositionId master_position_id);

  std::optional<domain::Position> find(
      domain::PositionId master_position_id) const;

  bool contains(domain::PositionId master_position_id) const;

  std::size_t size() const;

  // Immutable copy of every entry, ordered by master_position_id.
  std::vector<domain::Position> snapshot() const;

  // -------------------------------------------------------------------------
  // replaceAll(positions)
  // -------------------------------------------------------------------------
  //
  // @brief  Discards the current table and installs `positions`. Used by the
  //         full rebuild after a (re)connect. Later duplicates of the same
  //         master_position_id are ignored.
  // -------------------------------------------------------------------------
  void replaceAll(const std::vector<domain::Position>& positions);

  // -------------------------------------------------------------------------
  // merge(positions)
  // -------------------------------------------------------------------------
  //
  // @brief  Adds entries whose master_position_id is not yet present; never
  //         overwrites. Used by out-of-band reconciliation while workers are
  //         live.
  //
  // @return Number of entries added.
  // -------------------------------------------------------------------------
  std::size_t merge(const std::vector<domain::Position>& positions);

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::PositionId, domain::Position> positions_;
};

}  // namespace copier
