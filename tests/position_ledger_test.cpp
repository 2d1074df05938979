// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for copier::PositionLedger.
//
// Validates:
//   - upsertOpen / adjust / remove error values (DuplicateKey, NotFound)
//   - removeIfPresent is idempotent
//   - snapshot() is a sorted copy, unaffected by later mutation
//   - replaceAll() rebuilds, merge() never overwrites
//   - Concurrent writers on distinct keys and concurrent readers
// =============================================================================

#include "copier/ledger/position_ledger.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace {

copier::domain::Position makePosition(copier::domain::PositionId master_id,
                                      double master_volume = 0.10,
                                      double slave_volume = 0.05) {
  copier::domain::Position p;
  p.instrument_id = 1;
  p.slave_instrument_id = 1;
  p.master_position_id = master_id;
  p.slave_position_id = master_id + 10'000;
  p.side = copier::domain::Side::Long;
  p.master_volume = master_volume;
  p.slave_volume = slave_volume;
  return p;
}

}  // namespace

class PositionLedgerTest : public ::testing::Test {
 protected:
  copier::PositionLedger ledger;
};

// -----------------------------------------------------------------------------
// 1. An OPEN is recorded once; a second OPEN for the same key is rejected.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, UpsertOpenRejectsDuplicateKey) {
  EXPECT_EQ(ledger.upsertOpen(makePosition(1)), copier::ErrorKind::None);
  EXPECT_EQ(ledger.upsertOpen(makePosition(1, 0.5, 0.5)),
            copier::ErrorKind::DuplicateKey);

  auto stored = ledger.find(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_DOUBLE_EQ(stored->master_volume, 0.10);
  EXPECT_EQ(ledger.size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. adjust() updates both volumes; unknown keys yield NotFound.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, AdjustUpdatesVolumes) {
  ASSERT_EQ(ledger.upsertOpen(makePosition(1)), copier::ErrorKind::None);

  EXPECT_EQ(ledger.adjust(1, 0.06, 0.03), copier::ErrorKind::None);
  EXPECT_EQ(ledger.adjust(2, 0.06, 0.03), copier::ErrorKind::NotFound);

  auto stored = ledger.find(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_DOUBLE_EQ(stored->master_volume, 0.06);
  EXPECT_DOUBLE_EQ(stored->slave_volume, 0.03);
}

// -----------------------------------------------------------------------------
// 3. Volumes never go negative.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, VolumesAreNeverNegative) {
  ASSERT_EQ(ledger.upsertOpen(makePosition(1)), copier::ErrorKind::None);
  ASSERT_EQ(ledger.adjust(1, -0.01, -1.0), copier::ErrorKind::None);

  auto stored = ledger.find(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_GE(stored->master_volume, 0.0);
  EXPECT_GE(stored->slave_volume, 0.0);
}

// -----------------------------------------------------------------------------
// 4. remove() fails on a missing key; removeIfPresent() is idempotent.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RemoveAndRemoveIfPresent) {
  ASSERT_EQ(ledger.upsertOpen(makePosition(1)), copier::ErrorKind::None);
  ASSERT_EQ(ledger.upsertOpen(makePosition(2)), copier::ErrorKind::None);

  EXPECT_EQ(ledger.remove(1), copier::ErrorKind::None);
  EXPECT_EQ(ledger.remove(1), copier::ErrorKind::NotFound);

  auto removed = ledger.removeIfPresent(2);
  ASSERT_TRUE(removed.has_value());
  EXPECT_EQ(removed->master_position_id, 2);
  EXPECT_FALSE(ledger.removeIfPresent(2).has_value());
  EXPECT_EQ(ledger.size(), 0u);
}

// -----------------------------------------------------------------------------
// 5. snapshot() is sorted by master id and detached from the ledger.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, SnapshotIsSortedCopy) {
  ASSERT_EQ(ledger.upsertOpen(makePosition(30)), copier::ErrorKind::None);
  ASSERT_EQ(ledger.upsertOpen(makePosition(10)), copier::ErrorKind::None);
  ASSERT_EQ(ledger.upsertOpen(makePosition(20)), copier::ErrorKind::None);

  auto snap = ledger.snapshot();
  ASSERT_EQ(ledger.remove(20), copier::ErrorKind::None);

  ASSERT_EQ(snap.size(), 3u);
  EXPECT_EQ(snap[0].master_position_id, 10);
  EXPECT_EQ(snap[1].master_position_id, 20);
  EXPECT_EQ(snap[2].master_position_id, 30);
  EXPECT_EQ(ledger.size(), 2u);
}

// -----------------------------------------------------------------------------
// 6. replaceAll() discards old entries; merge() only adds unknown keys.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ReplaceAllAndMerge) {
  ASSERT_EQ(ledger.upsertOpen(makePosition(1)), copier::ErrorKind::None);

  ledger.replaceAll({makePosition(2), makePosition(3)});
  EXPECT_FALSE(ledger.contains(1));
  EXPECT_TRUE(ledger.contains(2));
  EXPECT_TRUE(ledger.contains(3));

  const std::size_t added =
      ledger.merge({makePosition(3, 9.0, 9.0), makePosition(4)});
  EXPECT_EQ(added, 1u);
  EXPECT_DOUBLE_EQ(ledger.find(3)->master_volume, 0.10);
  EXPECT_TRUE(ledger.contains(4));
}

// -----------------------------------------------------------------------------
// 7. Workers own disjoint keys; concurrent open/adjust/remove on distinct
//    keys with readers in parallel leaves a consistent ledger.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ConcurrentWritersOnDistinctKeys) {
  constexpr int kWriters = 4;
  constexpr int kKeysPerWriter = 200;

  std::vector<std::thread> threads;
  for (int w = 0; w < kWriters; ++w) {
    threads.emplace_back([this, w] {
      for (int k = 0; k < kKeysPerWriter; ++k) {
        const copier::domain::PositionId id = w * kKeysPerWriter + k;
        EXPECT_EQ(ledger.upsertOpen(makePosition(id)), copier::ErrorKind::None);
        EXPECT_EQ(ledger.adjust(id, 0.05, 0.03), copier::ErrorKind::None);
        if (k % 2 == 0) {
          EXPECT_EQ(ledger.remove(id), copier::ErrorKind::None);
        }
      }
    });
  }
  threads.emplace_back([this] {
    for (int i = 0; i < 200; ++i) {
      for (const auto& p : ledger.snapshot()) {
        EXPECT_GE(p.slave_volume, 0.0);
      }
    }
  });

  for (auto& t : threads) t.join();

  EXPECT_EQ(ledger.size(),
            static_cast<std::size_t>(kWriters * kKeysPerWriter / 2));
  for (const auto& p : ledger.snapshot()) {
    EXPECT_DOUBLE_EQ(p.master_volume, 0.05);
    EXPECT_DOUBLE_EQ(p.slave_volume, 0.03);
  }
}
