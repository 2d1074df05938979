// =============================================================================
// event_classifier_test.cpp
// =============================================================================
// Unit tests for copier::EventClassifier.
//
// Validates:
//   - Foreign-account and non position-impacting events are SKIPped
//   - Duplicate / out-of-order sequence numbers are SKIP DUPLICATE, per
//     instrument, and forgotten on resetSequences()
//   - OPEN only for a fill that takes an unknown position from zero; a
//     reducing or closing fill on an unknown position is never an OPEN
//   - ADJUST with the proportional slave volume on a reduction
//   - CLOSE on zero volume or POSITION_CLOSED, and for unknown positions
//   - Volume increases and unchanged volumes are SKIPped
// =============================================================================

#include "copier/classifier/event_classifier.hpp"
#include "copier/ledger/position_ledger.hpp"

#include <gtest/gtest.h>

using copier::CopyAction;
using copier::DecisionReason;
using copier::ExecutionEventKind;

namespace {

constexpr copier::domain::AccountId kMaster = 111;

}  // namespace

class EventClassifierTest : public ::testing::Test {
 protected:
  copier::EventClassifier classifier{kMaster};
  copier::PositionLedger ledger;
  std::uint64_t seq = 0;

  copier::ExecutionEvent makeEvent(copier::domain::PositionId id,
                                   ExecutionEventKind kind, double resulting,
                                   copier::domain::InstrumentId instrument = 1) {
    copier::ExecutionEvent e;
    e.account_id = kMaster;
    e.master_position_id = id;
    e.instrument_id = instrument;
    e.event_kind = kind;
    e.side = copier::domain::Side::Short;
    e.volume_delta = resulting;
    e.resulting_master_volume = resulting;
    e.timestamp_ms = 1'700'000'000'000;
    e.sequence_no = ++seq;
    return e;
  }

  void record(copier::domain::PositionId id, double master, double slave) {
    copier::domain::Position p;
    p.instrument_id = 1;
    p.slave_instrument_id = 1;
    p.master_position_id = id;
    p.slave_position_id = 900 + id;
    p.side = copier::domain::Side::Short;
    p.master_volume = master;
    p.slave_volume = slave;
    p.opened_at_ms = 42;
    ASSERT_EQ(ledger.upsertOpen(p), copier::ErrorKind::None);
  }
};

// -----------------------------------------------------------------------------
// 1. A fill for an unknown position opens it, on the master's side.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, FillForUnknownPositionOpens) {
  auto d = classifier.classify(
      makeEvent(7, ExecutionEventKind::OrderFilled, 0.10), ledger);

  EXPECT_EQ(d.action, CopyAction::Open);
  EXPECT_EQ(d.master_position_id, 7);
  EXPECT_EQ(d.side, copier::domain::Side::Short);
  EXPECT_DOUBLE_EQ(d.master_volume, 0.10);
}

// -----------------------------------------------------------------------------
// 2. Events from another account are never mirrored.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, ForeignAccountIsSkipped) {
  auto e = makeEvent(7, ExecutionEventKind::OrderFilled, 0.10);
  e.account_id = 222;

  auto d = classifier.classify(e, ledger);

  EXPECT_EQ(d.action, CopyAction::Skip);
  EXPECT_EQ(d.reason, DecisionReason::ForeignAccount);
}

// -----------------------------------------------------------------------------
// 3. Accepted, rejected, cancelled, expired and replaced orders do not move
//    a position.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, NonImpactingKindsAreSkipped) {
  for (auto kind : {ExecutionEventKind::OrderAccepted,
                    ExecutionEventKind::OrderRejected,
                    ExecutionEventKind::OrderCancelled,
                    ExecutionEventKind::OrderExpired,
                    ExecutionEventKind::OrderReplaced,
                    ExecutionEventKind::Unknown}) {
    auto d = classifier.classify(makeEvent(7, kind, 0.10), ledger);
    EXPECT_EQ(d.action, CopyAction::Skip) << copier::toString(kind);
    EXPECT_EQ(d.reason, DecisionReason::NotPositionImpacting);
  }
}

// -----------------------------------------------------------------------------
// 4. A repeated or older sequence number on the same instrument is a
//    duplicate; other instruments keep their own counter.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, DuplicateSequenceIsSkipped) {
  auto first = makeEvent(7, ExecutionEventKind::OrderFilled, 0.10);
  ASSERT_EQ(classifier.classify(first, ledger).action, CopyAction::Open);

  auto again = classifier.classify(first, ledger);
  EXPECT_EQ(again.action, CopyAction::Skip);
  EXPECT_EQ(again.reason, DecisionReason::Duplicate);

  auto older = first;
  older.sequence_no = first.sequence_no - 1;
  EXPECT_EQ(classifier.classify(older, ledger).reason,
            DecisionReason::Duplicate);

  auto other_instrument = first;
  other_instrument.instrument_id = 2;
  other_instrument.master_position_id = 8;
  EXPECT_EQ(classifier.classify(other_instrument, ledger).action,
            CopyAction::Open);
}

// -----------------------------------------------------------------------------
// 5. After a reconnect sequence numbers may restart.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, ResetSequencesAcceptsRestartedNumbers) {
  auto e = makeEvent(7, ExecutionEventKind::OrderFilled, 0.10);
  ASSERT_EQ(classifier.classify(e, ledger).action, CopyAction::Open);

  classifier.resetSequences();

  EXPECT_EQ(classifier.classify(e, ledger).action, CopyAction::Open);
}

// -----------------------------------------------------------------------------
// 6. A partial close yields ADJUST with the proportional slave volume:
//    master 0.10 -> 0.06 with slave 0.05 requests 0.03.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, ReductionAdjustsProportionally) {
  record(7, 0.10, 0.05);

  auto d = classifier.classify(
      makeEvent(7, ExecutionEventKind::OrderPartiallyFilled, 0.06), ledger);

  EXPECT_EQ(d.action, CopyAction::Adjust);
  EXPECT_DOUBLE_EQ(d.master_volume, 0.06);
  EXPECT_NEAR(d.requested_slave_volume, 0.03, 1e-12);
  EXPECT_EQ(d.opened_at_ms, 42);
}

// -----------------------------------------------------------------------------
// 7. Zero resulting volume or POSITION_CLOSED closes a known position.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, ZeroVolumeOrPositionClosedCloses) {
  record(7, 0.10, 0.05);
  record(8, 0.10, 0.05);

  auto by_volume = classifier.classify(
      makeEvent(7, ExecutionEventKind::OrderFilled, 0.0), ledger);
  auto by_kind = classifier.classify(
      makeEvent(8, ExecutionEventKind::PositionClosed, 0.10), ledger);

  EXPECT_EQ(by_volume.action, CopyAction::Close);
  EXPECT_EQ(by_volume.reason, DecisionReason::None);
  EXPECT_EQ(by_kind.action, CopyAction::Close);
}

// -----------------------------------------------------------------------------
// 8. A close for a position the ledger does not know is still a CLOSE,
//    marked UNKNOWN_POSITION, so the dispatcher reports NotFound and asks
//    for reconciliation.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, CloseOfUnknownPositionIsFlagged) {
  auto d = classifier.classify(
      makeEvent(99, ExecutionEventKind::PositionClosed, 0.0), ledger);

  EXPECT_EQ(d.action, CopyAction::Close);
  EXPECT_EQ(d.reason, DecisionReason::UnknownPosition);
}

// -----------------------------------------------------------------------------
// 9. Increases and unchanged volumes on a known position are not mirrored.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, IncreaseAndNoChangeAreSkipped) {
  record(7, 0.10, 0.05);

  auto grown = classifier.classify(
      makeEvent(7, ExecutionEventKind::OrderFilled, 0.20), ledger);
  auto same = classifier.classify(
      makeEvent(7, ExecutionEventKind::OrderFilled, 0.10), ledger);

  EXPECT_EQ(grown.action, CopyAction::Skip);
  EXPECT_EQ(grown.reason, DecisionReason::VolumeIncrease);
  EXPECT_EQ(same.action, CopyAction::Skip);
  EXPECT_EQ(same.reason, DecisionReason::NoVolumeChange);
}

// -----------------------------------------------------------------------------
// 10. A fill that only reduces a position the ledger never saw must not open
//     a slave position: it is flagged UNKNOWN_POSITION for reconciliation.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, ReducingFillOnUnknownPositionDoesNotOpen) {
  auto reduced = makeEvent(77, ExecutionEventKind::OrderFilled, 0.06);
  reduced.volume_delta = 0.04;

  auto d = classifier.classify(reduced, ledger);

  EXPECT_NE(d.action, CopyAction::Open);
  EXPECT_EQ(d.action, CopyAction::Close);
  EXPECT_EQ(d.reason, DecisionReason::UnknownPosition);
}

// -----------------------------------------------------------------------------
// 11. A closing deal never opens, even when its size equals what is left.
// -----------------------------------------------------------------------------
TEST_F(EventClassifierTest, ClosingDealOnUnknownPositionDoesNotOpen) {
  auto closing = makeEvent(78, ExecutionEventKind::OrderPartiallyFilled, 0.05);
  closing.closing = true;

  auto d = classifier.classify(closing, ledger);

  EXPECT_EQ(d.action, CopyAction::Close);
  EXPECT_EQ(d.reason, DecisionReason::UnknownPosition);
}
