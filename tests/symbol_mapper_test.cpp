// =============================================================================
// symbol_mapper_test.cpp
// =============================================================================
// Unit tests for copier::SymbolMapper.
//
// Validates:
//   - Ids resolve across brokers by symbol name
//   - Unknown ids or names on either side resolve to nothing
//   - Lookups are case-insensitive and honour aliases
//   - instruments() lists ids in ascending order
// =============================================================================

#include "copier/symbols/symbol_mapper.hpp"

#include <gtest/gtest.h>

#include <vector>

using copier::domain::Broker;

class SymbolMapperTest : public ::testing::Test {
 protected:
  copier::SymbolMapper mapper{
      {{"EURUSD", 1}, {"XAUUSD", 41}, {"US30", 45}},
      {{"EURUSD", 1001}, {"GOLD", 1041}, {"GBPUSD", 1002}},
      {{"gold", "xauusd"}}};
};

// -----------------------------------------------------------------------------
// 1. Same name, different ids: resolution goes both ways.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapperTest, ResolvesAcrossBrokers) {
  EXPECT_EQ(mapper.resolve(1, Broker::Master, Broker::Slave), 1001);
  EXPECT_EQ(mapper.resolve(1001, Broker::Slave, Broker::Master), 1);
  EXPECT_EQ(mapper.resolve(1, Broker::Master, Broker::Master), 1);
}

// -----------------------------------------------------------------------------
// 2. A symbol listed on one side only does not resolve.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapperTest, UnlistedSymbolDoesNotResolve) {
  EXPECT_FALSE(mapper.resolve(45, Broker::Master, Broker::Slave).has_value());
  EXPECT_FALSE(mapper.resolve(1002, Broker::Slave, Broker::Master).has_value());
  EXPECT_FALSE(mapper.resolve(999, Broker::Master, Broker::Slave).has_value());
}

// -----------------------------------------------------------------------------
// 3. Aliases fold broker spellings into the canonical name.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapperTest, AliasesMapToCanonicalName) {
  EXPECT_EQ(mapper.resolve(41, Broker::Master, Broker::Slave), 1041);
  EXPECT_EQ(mapper.name(1041, Broker::Slave), "XAUUSD");
  EXPECT_EQ(mapper.id("Gold", Broker::Slave), 1041);
}

// -----------------------------------------------------------------------------
// 4. Name lookups ignore case.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapperTest, NameLookupIsCaseInsensitive) {
  EXPECT_EQ(mapper.id("eurusd", Broker::Master), 1);
  EXPECT_EQ(mapper.id("EurUsd", Broker::Slave), 1001);
  EXPECT_FALSE(mapper.id("USDJPY", Broker::Master).has_value());
  EXPECT_FALSE(mapper.name(7, Broker::Master).has_value());
}

// -----------------------------------------------------------------------------
// 5. instruments() is sorted.
// -----------------------------------------------------------------------------
TEST_F(SymbolMapperTest, InstrumentsAreSorted) {
  EXPECT_EQ(mapper.instruments(Broker::Master),
            (std::vector<copier::domain::InstrumentId>{1, 41, 45}));
  EXPECT_EQ(mapper.instruments(Broker::Slave),
            (std::vector<copier::domain::InstrumentId>{1001, 1002, 1041}));
}

// -----------------------------------------------------------------------------
// 6. The default table maps every listed symbol onto itself.
// -----------------------------------------------------------------------------
TEST(SymbolMapperDefaultTest, DefaultTableIsSelfConsistent) {
  const auto table = copier::SymbolMapper::defaultSymbolTable();
  copier::SymbolMapper mapper(table, table);

  ASSERT_FALSE(table.empty());
  for (const auto& [symbol, id] : table) {
    EXPECT_EQ(mapper.resolve(id, Broker::Master, Broker::Slave), id) << symbol;
  }
  EXPECT_EQ(mapper.id("EURUSD", Broker::Master), 1);
  EXPECT_EQ(mapper.id("XAUUSD", Broker::Slave), 41);
}
