/**
 * @file test_ingest.cpp
 * @brief Unit tests for advertisement ingestion
 */

#include "../support/fake_radio.h"

#include <bluewatch/ingest.h>
#include <gtest/gtest.h>

using namespace bluewatch;
using bluewatch::test::make_advertisement;
using std::chrono::seconds;

namespace {

const TimePoint kStart = TimePoint(seconds(1700000000));
constexpr uint64_t kAddress = 0xC0FFEE000001ULL;

} // namespace

class IngestTest : public ::testing::Test {
protected:
  IngestResult ingest(const Advertisement &advertisement,
                      const std::optional<DeviceDetails> &details =
                          std::nullopt,
                      TimePoint now = kStart) {
    return ingest_advertisement(roster, advertisement, details, *catalog, now,
                                seconds(30));
  }

  RosterStore roster;
  std::shared_ptr<const GattServiceCatalog> catalog =
      GattServiceCatalog::standard();
};

// ============================================================================
// Discovery
// ============================================================================

TEST_F(IngestTest, FirstSightingIsNew) {
  auto result = ingest(make_advertisement(kAddress, "Foo", kStart, -55));

  EXPECT_TRUE(result.is_new);
  EXPECT_FALSE(result.name_changed);
  EXPECT_TRUE(result.timed_out.empty());
  EXPECT_EQ(result.record.name(), "Foo");
  EXPECT_EQ(result.record.rssi_dbm(), -55);
  EXPECT_EQ(roster.size(), 1u);
}

TEST_F(IngestTest, RepeatSightingUpdatesSignal) {
  ingest(make_advertisement(kAddress, "Foo", kStart, -55));
  auto result =
      ingest(make_advertisement(kAddress, "Foo", kStart + seconds(1), -70));

  EXPECT_FALSE(result.is_new);
  EXPECT_FALSE(result.name_changed);
  EXPECT_EQ(result.record.rssi_dbm(), -70);
  EXPECT_EQ(result.record.broadcast_time(), kStart + seconds(1));
}

// ============================================================================
// Names
// ============================================================================

TEST_F(IngestTest, EmptyNameKeepsKnownName) {
  ingest(make_advertisement(kAddress, "Foo", kStart));
  auto result = ingest(make_advertisement(kAddress, "", kStart + seconds(1)));

  EXPECT_EQ(result.record.name(), "Foo");
  EXPECT_FALSE(result.name_changed);
}

TEST_F(IngestTest, DifferentNameIsAChange) {
  ingest(make_advertisement(kAddress, "Foo", kStart));
  auto result =
      ingest(make_advertisement(kAddress, "Bar", kStart + seconds(1)));

  EXPECT_EQ(result.record.name(), "Bar");
  EXPECT_TRUE(result.name_changed);
}

TEST_F(IngestTest, FillingMissingNameIsNotAChange) {
  ingest(make_advertisement(kAddress, "", kStart));
  auto result =
      ingest(make_advertisement(kAddress, "Foo", kStart + seconds(1)));

  EXPECT_EQ(result.record.name(), "Foo");
  EXPECT_FALSE(result.name_changed);
}

TEST_F(IngestTest, ResolvedNameFillsEmptyAdvertisement) {
  DeviceDetails details;
  details.display_name = "Kitchen Sensor";

  auto result = ingest(make_advertisement(kAddress, "", kStart), details);
  EXPECT_EQ(result.record.name(), "Kitchen Sensor");
}

TEST_F(IngestTest, AdvertisedNameWinsOverResolvedName) {
  DeviceDetails details;
  details.display_name = "Cached";

  auto result = ingest(make_advertisement(kAddress, "Live", kStart), details);
  EXPECT_EQ(result.record.name(), "Live");
}

// ============================================================================
// Timestamps
// ============================================================================

TEST_F(IngestTest, OutOfOrderKeepsNewestTimestamp) {
  ingest(make_advertisement(kAddress, "Foo", kStart + seconds(5), -50));
  auto result = ingest(make_advertisement(kAddress, "Foo", kStart, -65),
                       std::nullopt, kStart + seconds(5));

  EXPECT_EQ(result.record.broadcast_time(), kStart + seconds(5));
  EXPECT_EQ(result.record.rssi_dbm(), -65);
}

TEST_F(IngestTest, LeadingSweepEvictsStaleDevices) {
  ingest(make_advertisement(1, "Old", kStart));
  auto result = ingest(make_advertisement(2, "New", kStart + seconds(40)),
                       std::nullopt, kStart + seconds(40));

  ASSERT_EQ(result.timed_out.size(), 1u);
  EXPECT_EQ(result.timed_out[0].name(), "Old");
  EXPECT_EQ(roster.size(), 1u);
}

TEST_F(IngestTest, StaleDeviceComesBackAsNew) {
  ingest(make_advertisement(kAddress, "Foo", kStart));
  auto result = ingest(make_advertisement(kAddress, "Foo", kStart + seconds(31)),
                       std::nullopt, kStart + seconds(31));

  EXPECT_TRUE(result.is_new);
  EXPECT_EQ(result.timed_out.size(), 1u);
}

// ============================================================================
// Details and Services
// ============================================================================

TEST_F(IngestTest, DetailsSetFlags) {
  DeviceDetails details;
  details.connected = true;
  details.paired = true;
  details.device_id = "/org/bluez/hci0/dev_C0_FF_EE_00_00_01";

  auto result = ingest(make_advertisement(kAddress, "Foo", kStart), details);
  EXPECT_TRUE(result.record.connected());
  EXPECT_TRUE(result.record.paired());
  EXPECT_FALSE(result.record.can_pair());
  EXPECT_EQ(result.record.device_id(), details.device_id);
}

TEST_F(IngestTest, FlagsCarryOverWithoutDetails) {
  DeviceDetails details;
  details.can_pair = true;
  details.device_id = "dev-1";
  ingest(make_advertisement(kAddress, "Foo", kStart), details);

  auto result = ingest(make_advertisement(kAddress, "Foo", kStart + seconds(1)));
  EXPECT_TRUE(result.record.can_pair());
  EXPECT_EQ(result.record.device_id(), "dev-1");
}

TEST_F(IngestTest, ServicesResolvedFromCatalog) {
  auto result = ingest(
      make_advertisement(kAddress, "Watch", kStart, -60, {"180d", "180f"}));

  ASSERT_EQ(result.record.services().size(), 2u);
  EXPECT_EQ(result.record.services()[0].name, "Heart Rate");
  EXPECT_EQ(result.record.services()[1].name, "Battery Service");
}

TEST_F(IngestTest, ServicesKeptWhenAdvertisementListsNone) {
  ingest(make_advertisement(kAddress, "Watch", kStart, -60, {"180f"}));
  auto result = ingest(make_advertisement(kAddress, "Watch", kStart + seconds(1)));

  ASSERT_EQ(result.record.services().size(), 1u);
  EXPECT_EQ(result.record.services()[0].assigned_number, 0x180F);
}
