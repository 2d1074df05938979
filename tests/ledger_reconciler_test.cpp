// =============================================================================
// ledger_reconciler_test.cpp
// =============================================================================
// Unit tests for copier::LedgerReconciler.
//
// Validates:
//   - Label pass pairs "copier:<id>" slave positions regardless of timing
//   - Heuristic pass: same mapped instrument and side, open-time tolerance,
//     volume ratio bound
//   - Closest open time wins, then the ratio nearest the expected ratio
//   - Leftovers are reported as unpaired masters and orphan slaves
//   - Labels that are malformed or do not fit a position id pair nothing
// =============================================================================

#include "copier/domain/order_request.hpp"
#include "copier/ledger/ledger_reconciler.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

using copier::domain::LivePosition;
using copier::domain::Side;

namespace {

LivePosition live(copier::domain::PositionId id,
                  copier::domain::InstrumentId instrument, double volume,
                  std::int64_t opened_at_ms, Side side = Side::Long,
                  std::string label = {}) {
  LivePosition p;
  p.position_id = id;
  p.instrument_id = instrument;
  p.volume = volume;
  p.opened_at_ms = opened_at_ms;
  p.side = side;
  p.label = std::move(label);
  return p;
}

const copier::domain::Position* pairFor(const copier::ReconcileResult& r,
                                        copier::domain::PositionId master) {
  auto it = std::find_if(r.paired.begin(), r.paired.end(),
                         [&](const copier::domain::Position& p) {
                           return p.master_position_id == master;
                         });
  return it == r.paired.end() ? nullptr : &*it;
}

}  // namespace

class LedgerReconcilerTest : public ::testing::Test {
 protected:
  LedgerReconcilerTest()
      : mapper({{"EURUSD", 1}, {"GBPUSD", 2}},
               {{"EURUSD", 1001}, {"GBPUSD", 1002}}),
        reconciler(mapper, copier::ReconcileSettings{}) {}

  copier::SymbolMapper mapper;
  copier::LedgerReconciler reconciler;
};

// -----------------------------------------------------------------------------
// 1. A labelled slave pairs with its master even far outside the tolerance.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, LabelPassPairsRegardlessOfTiming) {
  auto result = reconciler.reconcile(
      {live(10, 1, 0.10, 1'000)},
      {live(900, 1001, 0.05, 9'000'000, Side::Long, "copier:10")});

  ASSERT_EQ(result.paired.size(), 1u);
  EXPECT_EQ(result.label_matches, 1u);
  const auto& p = result.paired[0];
  EXPECT_EQ(p.master_position_id, 10);
  EXPECT_EQ(p.slave_position_id, 900);
  EXPECT_EQ(p.instrument_id, 1);
  EXPECT_EQ(p.slave_instrument_id, 1001);
  EXPECT_DOUBLE_EQ(p.master_volume, 0.10);
  EXPECT_DOUBLE_EQ(p.slave_volume, 0.05);
  EXPECT_TRUE(result.unpaired_master.empty());
  EXPECT_TRUE(result.orphan_slave.empty());
}

// -----------------------------------------------------------------------------
// 2. Unlabelled positions pair on instrument, side, and open time.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, HeuristicPairsOnInstrumentSideAndTime) {
  auto result = reconciler.reconcile(
      {live(10, 1, 0.10, 100'000), live(11, 2, 0.20, 100'000, Side::Short)},
      {live(900, 1001, 0.05, 101'000),
       live(901, 1002, 0.10, 130'000, Side::Short)});

  ASSERT_EQ(result.paired.size(), 2u);
  EXPECT_EQ(result.label_matches, 0u);
  ASSERT_NE(pairFor(result, 10), nullptr);
  EXPECT_EQ(pairFor(result, 10)->slave_position_id, 900);
  ASSERT_NE(pairFor(result, 11), nullptr);
  EXPECT_EQ(pairFor(result, 11)->slave_position_id, 901);
}

// -----------------------------------------------------------------------------
// 3. Wrong side, wrong instrument, too late, or too large never pair.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, HeuristicRejectsMismatches) {
  auto result = reconciler.reconcile(
      {live(10, 1, 0.10, 100'000)},
      {live(900, 1001, 0.05, 100'000, Side::Short),   // side
       live(901, 1002, 0.05, 100'000),                // instrument
       live(902, 1001, 0.05, 200'000),                // outside 60 s
       live(903, 1001, 0.50, 100'000)});              // ratio 5 > 2

  EXPECT_TRUE(result.paired.empty());
  ASSERT_EQ(result.unpaired_master.size(), 1u);
  EXPECT_EQ(result.unpaired_master[0].position_id, 10);
  EXPECT_EQ(result.orphan_slave.size(), 4u);
}

// -----------------------------------------------------------------------------
// 4. The closest open time wins; equal times fall back to the ratio nearest
//    the expected ratio.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, TieBreakOnTimeThenRatio) {
  auto by_time = reconciler.reconcile(
      {live(10, 1, 0.10, 100'000)},
      {live(900, 1001, 0.05, 140'000), live(901, 1001, 0.10, 101'000)});
  ASSERT_NE(pairFor(by_time, 10), nullptr);
  EXPECT_EQ(pairFor(by_time, 10)->slave_position_id, 901);

  auto by_ratio = reconciler.reconcile(
      {live(10, 1, 0.10, 100'000)},
      {live(900, 1001, 0.10, 105'000), live(901, 1001, 0.05, 105'000)});
  ASSERT_NE(pairFor(by_ratio, 10), nullptr);
  EXPECT_EQ(pairFor(by_ratio, 10)->slave_position_id, 901);
}

// -----------------------------------------------------------------------------
// 5. A slave is used at most once; the oldest master claims it.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, EachSlavePairsOnce) {
  auto result = reconciler.reconcile(
      {live(11, 1, 0.10, 120'000), live(10, 1, 0.10, 100'000)},
      {live(900, 1001, 0.05, 110'000)});

  ASSERT_EQ(result.paired.size(), 1u);
  EXPECT_EQ(result.paired[0].master_position_id, 10);
  ASSERT_EQ(result.unpaired_master.size(), 1u);
  EXPECT_EQ(result.unpaired_master[0].position_id, 11);
}

// -----------------------------------------------------------------------------
// 6. Slaves with a label but no live master are orphans.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, LabelledSlaveWithoutMasterIsOrphan) {
  auto result = reconciler.reconcile(
      {}, {live(900, 1001, 0.05, 100'000, Side::Long, "copier:77"),
           live(901, 1001, 0.05, 100'000, Side::Long, "manual trade")});

  EXPECT_TRUE(result.paired.empty());
  EXPECT_EQ(result.orphan_slave.size(), 2u);
}

// -----------------------------------------------------------------------------
// 7. Copy labels parse only as "copier:<decimal id>" within the id range. An
//    oversized label must not pair with whatever id it would wrap to.
// -----------------------------------------------------------------------------
TEST_F(LedgerReconcilerTest, OversizedOrMalformedLabelsDoNotPair) {
  using copier::domain::parseCopyLabel;
  EXPECT_EQ(parseCopyLabel("copier:42").value_or(0), 42);
  EXPECT_EQ(parseCopyLabel("copier:9223372036854775807").value_or(0),
            9223372036854775807LL);
  EXPECT_FALSE(parseCopyLabel("copier:99999999999999999999").has_value());
  EXPECT_FALSE(parseCopyLabel("copier:9223372036854775808").has_value());
  EXPECT_FALSE(parseCopyLabel("copier:-5").has_value());
  EXPECT_FALSE(parseCopyLabel("copier:12ab").has_value());
  EXPECT_FALSE(parseCopyLabel("copier:").has_value());
  EXPECT_FALSE(parseCopyLabel("other:12").has_value());

  auto result = reconciler.reconcile(
      {live(7766279631452241919LL, 1, 0.10, 10'000'000)},
      {live(900, 1001, 0.05, 100'000, Side::Long,
            "copier:99999999999999999999")});

  EXPECT_TRUE(result.paired.empty());
  EXPECT_EQ(result.unpaired_master.size(), 1u);
  EXPECT_EQ(result.orphan_slave.size(), 1u);
}
