/**
 * @file test_concurrent_ingestion.cpp
 * @brief Integration tests: many radio threads feeding one watcher
 */

#include "../support/fake_radio.h"

#include <atomic>
#include <bluewatch/bluewatch.h>
#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace bluewatch;
using bluewatch::test::FakeRadio;
using bluewatch::test::ManualClock;
using bluewatch::test::make_advertisement;

class ConcurrentIngestionTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto fake = std::make_unique<FakeRadio>();
    radio = fake.get();

    WatcherConfig config;
    config.log_level = "warn";
    ASSERT_TRUE(watcher.init(std::move(fake), config, clock.source()).is_ok());
    ASSERT_TRUE(watcher.start_listening().is_ok());
  }

  ManualClock clock;
  AdvertisementWatcher watcher;
  FakeRadio *radio = nullptr;
};

// ============================================================================
// Distinct Devices
// ============================================================================

TEST_F(ConcurrentIngestionTest, DistinctAddressesAllLand) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;

  std::atomic<int> new_devices{0};
  watcher.on_new_device_discovered(
      [&](const DeviceRecord &) { new_devices.fetch_add(1); });

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        uint64_t address = (static_cast<uint64_t>(t) << 16) | i;
        radio->deliver(make_advertisement(address,
                                          "dev-" + std::to_string(address),
                                          clock.now()));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  auto devices = watcher.get_discovered_devices();
  EXPECT_EQ(devices.size(), static_cast<size_t>(kThreads * kPerThread));
  EXPECT_EQ(new_devices.load(), kThreads * kPerThread);

  std::set<uint64_t> addresses;
  for (const auto &device : devices) {
    addresses.insert(device.address().value);
  }
  EXPECT_EQ(addresses.size(), devices.size());
}

// ============================================================================
// One Device, Many Writers
// ============================================================================

TEST_F(ConcurrentIngestionTest, SameAddressStaysConsistent) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 200;
  const BluetoothAddress address(0xFEEDFACE0001ULL);

  std::atomic<int> new_devices{0};
  watcher.on_new_device_discovered(
      [&](const DeviceRecord &) { new_devices.fetch_add(1); });

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        // Name and signal strength always travel together
        int k = t * kPerThread + i + 1;
        radio->deliver(make_advertisement(address.value,
                                          "dev-" + std::to_string(k),
                                          clock.now(),
                                          static_cast<int16_t>(-(k % 100))));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  auto devices = watcher.get_discovered_devices();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(new_devices.load(), 1);

  const DeviceRecord &device = devices[0];
  ASSERT_EQ(device.name().rfind("dev-", 0), 0u);
  int k = std::stoi(device.name().substr(4));
  EXPECT_EQ(device.rssi_dbm(), -(k % 100));
}

TEST_F(ConcurrentIngestionTest, SnapshotsNeverSeeTornRecords) {
  const BluetoothAddress address(0xFEEDFACE0002ULL);
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::thread writer([&] {
    for (int k = 1; k <= 2000; ++k) {
      radio->deliver(make_advertisement(address.value,
                                        "dev-" + std::to_string(k),
                                        clock.now(),
                                        static_cast<int16_t>(-(k % 100))));
    }
    done = true;
  });

  std::thread reader([&] {
    while (!done) {
      for (const auto &device : watcher.get_discovered_devices()) {
        int k = std::stoi(device.name().substr(4));
        if (device.rssi_dbm() != -(k % 100)) {
          torn.fetch_add(1);
        }
      }
    }
  });

  writer.join();
  reader.join();
  EXPECT_EQ(torn.load(), 0);
}

// ============================================================================
// Stop While Ingesting
// ============================================================================

TEST_F(ConcurrentIngestionTest, StopDuringIngestionLeavesEmptyRoster) {
  std::atomic<int> stopped{0};
  watcher.on_stopped([&](const StopReason &) { stopped.fetch_add(1); });

  std::atomic<bool> done{false};
  std::thread writer([&] {
    uint64_t i = 0;
    while (!done) {
      radio->deliver(make_advertisement(++i, "dev", clock.now()));
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  watcher.stop_listening();
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  done = true;
  writer.join();

  EXPECT_EQ(stopped.load(), 1);
  EXPECT_FALSE(watcher.is_listening());
  EXPECT_TRUE(watcher.get_discovered_devices().empty());
}
