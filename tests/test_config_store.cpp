// test_config_store.cpp — PersistentConfigStore over an in-memory medium.

#include <gtest/gtest.h>

#include "fake_backend.hpp"
#include "memory_medium.hpp"
#include "relay_config.hpp"

using namespace picorelay;
using picorelay::test::FakeClock;
using picorelay::test::MemoryMedium;

class ConfigStoreTest : public ::testing::Test {
 protected:
  ConfigStoreTest() : store(medium, clock) {}

  MemoryMedium          medium;
  FakeClock             clock;
  PersistentConfigStore store;
};

TEST(ConfigDefaults, Document) {
  const RelayConfig cfg = make_default_config(42);
  EXPECT_EQ(cfg.names[0], "Relay 1");
  EXPECT_EQ(cfg.names[7], "Relay 8");
  for (uint8_t s : cfg.states) EXPECT_EQ(s, 0);
  EXPECT_TRUE(cfg.auto_load);
  EXPECT_TRUE(cfg.settings.auto_save);
  EXPECT_EQ(cfg.settings.created_time, 42u);
  EXPECT_FALSE(cfg.settings.has_last_saved);
}

TEST_F(ConfigStoreTest, EmptyMediumGetsDefaultsWritten) {
  std::string name;
  ASSERT_TRUE(store.get_name(3, name));
  EXPECT_EQ(name, "Relay 3");
  EXPECT_TRUE(medium.has_doc);
  EXPECT_EQ(medium.writes, 1);
  EXPECT_EQ(medium.doc.settings.created_time, clock.now);
}

TEST_F(ConfigStoreTest, CorruptMediumIsReplacedByDefaults) {
  medium.corrupt = true;
  bool auto_load = false;
  ASSERT_TRUE(store.get_auto_load(auto_load));
  EXPECT_TRUE(auto_load);
  EXPECT_FALSE(medium.corrupt);
  EXPECT_EQ(medium.writes, 1);
}

TEST_F(ConfigStoreTest, UnreadableMediumFallsBackToDefaults) {
  ASSERT_TRUE(store.set_name(1, "PUMP"));
  ASSERT_TRUE(store.save_states("10000000"));
  medium.read_error = true;

  std::string s;
  ASSERT_TRUE(store.get_name(1, s));
  EXPECT_EQ(s, "Relay 1");

  bool auto_load = false;
  ASSERT_TRUE(store.get_auto_load(auto_load));
  EXPECT_TRUE(auto_load);

  EXPECT_EQ(store.load_states(s), LoadResult::ABSENT);

  // Defaults were pushed back to the medium on each read.
  EXPECT_EQ(medium.doc.names[0], "Relay 1");
  EXPECT_FALSE(medium.doc.settings.has_last_saved);
}

TEST_F(ConfigStoreTest, UnreadableMediumStillAcceptsWrites) {
  medium.read_error = true;
  EXPECT_TRUE(store.set_name(2, "FAN"));
  EXPECT_EQ(medium.doc.names[1], "FAN");
  EXPECT_TRUE(store.save_states("01000000"));
  EXPECT_TRUE(medium.doc.settings.has_last_saved);

  medium.write_fails = true;
  EXPECT_FALSE(store.set_name(2, "FAN"));
  EXPECT_FALSE(store.save_states("01000000"));
  EXPECT_FALSE(store.clear_states());
}

TEST_F(ConfigStoreTest, NamesPersistAndClear) {
  ASSERT_TRUE(store.set_name(2, "PUMP"));
  std::string name;
  ASSERT_TRUE(store.get_name(2, name));
  EXPECT_EQ(name, "PUMP");

  ASSERT_TRUE(store.set_name(2, ""));
  ASSERT_TRUE(store.get_name(2, name));
  EXPECT_EQ(name, "");
}

TEST_F(ConfigStoreTest, NameBoundsAreEnforced) {
  std::string name;
  EXPECT_FALSE(store.get_name(0, name));
  EXPECT_FALSE(store.get_name(9, name));
  EXPECT_FALSE(store.set_name(9, "X"));
  EXPECT_TRUE(store.set_name(1, std::string(32, 'N')));
  EXPECT_FALSE(store.set_name(1, std::string(33, 'N')));
}

TEST_F(ConfigStoreTest, WriteFailureIsReported) {
  ASSERT_TRUE(store.set_name(1, "A"));
  medium.write_fails = true;
  EXPECT_FALSE(store.set_name(1, "B"));
  EXPECT_FALSE(store.save_states("00000000"));
  EXPECT_FALSE(store.clear_states());
  EXPECT_FALSE(store.set_auto_load(false));
}

TEST_F(ConfigStoreTest, SaveLoadClearSnapshot) {
  std::string storage;
  EXPECT_EQ(store.load_states(storage), LoadResult::ABSENT);

  clock.now = 5000;
  ASSERT_TRUE(store.save_states("10000001"));
  EXPECT_TRUE(medium.doc.settings.has_last_saved);
  EXPECT_EQ(medium.doc.settings.last_saved, 5000u);
  EXPECT_EQ(medium.doc.states[0], 1);
  EXPECT_EQ(medium.doc.states[1], 0);

  ASSERT_EQ(store.load_states(storage), LoadResult::LOADED);
  EXPECT_EQ(storage, "10000001");

  ASSERT_TRUE(store.clear_states());
  EXPECT_EQ(store.load_states(storage), LoadResult::ABSENT);
  for (uint8_t s : medium.doc.states) EXPECT_EQ(s, 0);
}

TEST_F(ConfigStoreTest, AllZeroSnapshotStillCountsAsSaved) {
  ASSERT_TRUE(store.save_states("00000000"));
  std::string storage;
  ASSERT_EQ(store.load_states(storage), LoadResult::LOADED);
  EXPECT_EQ(storage, "00000000");
}

TEST_F(ConfigStoreTest, SaveRejectsMalformedStorage) {
  EXPECT_FALSE(store.save_states("101"));
  EXPECT_FALSE(store.save_states("1000000X"));
}

TEST_F(ConfigStoreTest, AutoLoadToggle) {
  ASSERT_TRUE(store.set_auto_load(false));
  bool on = true;
  ASSERT_TRUE(store.get_auto_load(on));
  EXPECT_FALSE(on);
}

TEST_F(ConfigStoreTest, UpdatesKeepOtherFields) {
  ASSERT_TRUE(store.set_name(4, "FAN"));
  ASSERT_TRUE(store.save_states("00010000"));
  ASSERT_TRUE(store.set_auto_load(false));
  EXPECT_EQ(medium.doc.names[3], "FAN");
  EXPECT_EQ(medium.doc.states[3], 1);
  EXPECT_FALSE(medium.doc.auto_load);
}
