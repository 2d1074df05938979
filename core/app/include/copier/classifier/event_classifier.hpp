#pragma once

#include "copier/domain/types.hpp"
#include "copier/events/copy_decision.hpp"
#include "copier/events/execution_event.hpp"
#include "copier/ledger/position_ledger.hpp"

#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace copier {

// -----------------------------------------------------------------------------
// EventClassifier
// -----------------------------------------------------------------------------
//
// @brief  Turns one master ExecutionEvent into one CopyDecision.
//
// @details
// Rules, in order:
//
//   foreign account                          -> SKIP FOREIGN_ACCOUNT
//   sequence_no <= last seen for instrument  -> SKIP DUPLICATE
//   kind without position impact             -> SKIP NOT_POSITION_IMPACTING
//   position in ledger:
//     resulting volume == 0                  -> CLOSE
//     0 < resulting < recorded master volume -> ADJUST (proportional)
//     resulting == recorded                  -> SKIP NO_VOLUME_CHANGE
//     resulting > recorded                   -> SKIP VOLUME_INCREASE
//   position not in ledger:
//     close (POSITION_CLOSED or volume 0)    -> CLOSE UNKNOWN_POSITION
//     fill with volume > 0                   -> OPEN
//
// ADJUST scales the recorded slave volume by new_master / recorded_master;
// the volume policy is not re-run, so rounding error does not compound over
// repeated partial closes.
//
// The ledger is only read. The only state the classifier keeps is a
// per-instrument sequence high-water mark, valid for one connection epoch;
// the session coordinator calls resetSequences() at every (re)subscribe.
//
// Thread model: classify() may be called concurrently from all workers; the
// sequence table is guarded by a mutex.
// -----------------------------------------------------------------------------
class EventClassifier {
 public:
  explicit EventClassifier(domain::AccountId master_account_id);

  EventClassifier(const EventClassifier&) = delete;
  EventClassifier& operator=(const EventClassifier&) = delete;

  CopyDecision classify(const ExecutionEvent& event,
                        const PositionLedger& ledger);

  // Forget all sequence expectations (new connection epoch).
  void resetSequences();

  static bool isPositionImpacting(ExecutionEventKind kind);

 private:
  // True if sequence_no is new for the instrument; records it.
  bool acceptSequence(domain::InstrumentId instrument_id,
                      std::uint64_t sequence_no);

  domain::AccountId master_account_id_;

  std::mutex sequence_mutex_;
  std::unordered_map<domain::InstrumentId, std::uint64_t> last_sequence_;
};

}  // namespace copier
