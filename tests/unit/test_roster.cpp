/**
 * @file test_roster.cpp
 * @brief Unit tests for RosterStore
 */

#include <bluewatch/roster.h>
#include <gtest/gtest.h>

using namespace bluewatch;
using std::chrono::seconds;

namespace {

const TimePoint kStart = TimePoint(seconds(1700000000));

DeviceRecord make_record(uint64_t address, const std::string &name,
                         TimePoint time, int16_t rssi = -60) {
  return DeviceRecord(BluetoothAddress(address), name, time, rssi);
}

} // namespace

class RosterStoreTest : public ::testing::Test {
protected:
  RosterStore roster;
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(RosterStoreTest, StartsEmpty) {
  EXPECT_EQ(roster.size(), 0u);
  EXPECT_TRUE(roster.snapshot(kStart, seconds(30)).empty());
}

TEST_F(RosterStoreTest, UpsertReportsNewAddress) {
  EXPECT_TRUE(roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart)));
  EXPECT_FALSE(roster.upsert(BluetoothAddress(1), make_record(1, "B", kStart)));

  EXPECT_EQ(roster.size(), 1u);
  EXPECT_EQ(roster.find(BluetoothAddress(1))->name(), "B");
}

TEST_F(RosterStoreTest, SnapshotIsOrderedByAddress) {
  roster.upsert(BluetoothAddress(3), make_record(3, "C", kStart));
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart));
  roster.upsert(BluetoothAddress(2), make_record(2, "B", kStart));

  auto devices = roster.snapshot(kStart, seconds(30));
  ASSERT_EQ(devices.size(), 3u);
  EXPECT_EQ(devices[0].name(), "A");
  EXPECT_EQ(devices[1].name(), "B");
  EXPECT_EQ(devices[2].name(), "C");
}

TEST_F(RosterStoreTest, SnapshotUnaffectedByLaterMutation) {
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart));
  auto before = roster.snapshot(kStart, seconds(30));

  roster.upsert(BluetoothAddress(1), make_record(1, "B", kStart, -40));
  roster.upsert(BluetoothAddress(3), make_record(3, "C", kStart));

  ASSERT_EQ(before.size(), 1u);
  EXPECT_EQ(before[0].name(), "A");
  EXPECT_EQ(before[0].rssi_dbm(), -60);
  EXPECT_EQ(roster.snapshot(kStart, seconds(30)).size(), 2u);
}

TEST_F(RosterStoreTest, ClearDropsEverything) {
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart));
  roster.clear();
  EXPECT_EQ(roster.size(), 0u);
  EXPECT_FALSE(roster.find(BluetoothAddress(1)).has_value());
}

// ============================================================================
// Timeouts
// ============================================================================

TEST_F(RosterStoreTest, SurvivesJustInsideTimeout) {
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart));

  auto devices = roster.snapshot(kStart + seconds(29), seconds(30));
  EXPECT_EQ(devices.size(), 1u);
}

TEST_F(RosterStoreTest, ExactlyAtTimeoutIsKept) {
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart));

  EXPECT_TRUE(roster.sweep_timeouts(kStart + seconds(30), seconds(30)).empty());
  EXPECT_EQ(roster.size(), 1u);
}

TEST_F(RosterStoreTest, EvictedPastTimeout) {
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart));
  roster.upsert(BluetoothAddress(2), make_record(2, "B", kStart + seconds(10)));

  std::vector<DeviceRecord> evicted;
  auto devices = roster.snapshot(kStart + seconds(31), seconds(30), &evicted);

  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].name(), "B");
  ASSERT_EQ(evicted.size(), 1u);
  EXPECT_EQ(evicted[0].name(), "A");
}

TEST_F(RosterStoreTest, SweepReportsEachEvictionOnce) {
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart));

  EXPECT_EQ(roster.sweep_timeouts(kStart + seconds(60), seconds(30)).size(), 1u);
  EXPECT_TRUE(roster.sweep_timeouts(kStart + seconds(60), seconds(30)).empty());
}

// ============================================================================
// Atomic Update
// ============================================================================

TEST_F(RosterStoreTest, UpdateInsertsNewRecord) {
  auto update = roster.update(
      BluetoothAddress(1), kStart, seconds(30),
      [](const DeviceRecord *existing) {
        EXPECT_EQ(existing, nullptr);
        return make_record(1, "A", kStart);
      });

  EXPECT_TRUE(update.is_new);
  EXPECT_FALSE(update.previous.has_value());
  EXPECT_EQ(update.record.name(), "A");
  EXPECT_EQ(roster.size(), 1u);
}

TEST_F(RosterStoreTest, UpdateSeesExistingRecord) {
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart, -80));

  auto update = roster.update(
      BluetoothAddress(1), kStart + seconds(1), seconds(30),
      [](const DeviceRecord *existing) {
        EXPECT_NE(existing, nullptr);
        return make_record(1, existing->name() + "2", kStart + seconds(1), -40);
      });

  EXPECT_FALSE(update.is_new);
  ASSERT_TRUE(update.previous.has_value());
  EXPECT_EQ(update.previous->rssi_dbm(), -80);
  EXPECT_EQ(update.record.name(), "A2");
  EXPECT_EQ(roster.find(BluetoothAddress(1))->rssi_dbm(), -40);
}

TEST_F(RosterStoreTest, UpdateSweepsBeforeLookup) {
  roster.upsert(BluetoothAddress(1), make_record(1, "A", kStart));

  auto update = roster.update(BluetoothAddress(1), kStart + seconds(45),
                              seconds(30), [](const DeviceRecord *existing) {
                                EXPECT_EQ(existing, nullptr);
                                return make_record(1, "A",
                                                   kStart + seconds(45));
                              });

  EXPECT_TRUE(update.is_new);
  ASSERT_EQ(update.evicted.size(), 1u);
  EXPECT_EQ(update.evicted[0].address(), BluetoothAddress(1));
}
