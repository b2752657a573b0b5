/**
 * @file fake_radio.h
 * @brief Scriptable radio and clock for watcher tests
 */

#ifndef BLUEWATCH_TESTS_FAKE_RADIO_H
#define BLUEWATCH_TESTS_FAKE_RADIO_H

#include <bluewatch/radio.h>
#include <bluewatch/types.h>

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace bluewatch {
namespace test {

/**
 * @brief Radio driven by the test
 *
 * deliver() plays the part of the platform receiving an advertisement,
 * halt() the platform stopping on its own. stop() reports the stop back
 * synchronously, the way the BlueZ radio does.
 */
class FakeRadio : public AdvertisementRadio {
public:
  void set_scan_mode(ScanMode mode) override {
    std::lock_guard<std::mutex> lock(mutex_);
    scan_mode_ = mode;
  }

  void on_advertisement_received(AdvertisementHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    advertisement_handler_ = std::move(handler);
  }

  void on_listener_stopped(StoppedHandler handler) override {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_handler_ = std::move(handler);
  }

  Result<void> start() override {
    std::function<void()> hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++start_calls_;
      if (fail_start_) {
        return Error(ErrorCode::BluetoothOff, "Adapter is powered off");
      }
      status_ = RadioStatus::Started;
      hook = start_hook_;
    }
    if (hook) {
      hook();
    }
    return Result<void>::ok();
  }

  void stop() override {
    StoppedHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++stop_calls_;
      if (status_ == RadioStatus::Stopped) {
        return;
      }
      status_ = RadioStatus::Stopped;
      handler = stopped_handler_;
    }
    if (handler) {
      handler();
    }
  }

  RadioStatus current_status() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
  }

  bool supports_device_resolution() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolution_enabled_;
  }

  Result<DeviceDetails> resolve_device(const BluetoothAddress &address,
                                       std::chrono::milliseconds) override {
    ++resolve_calls_;

    std::function<void()> hook;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      hook = resolve_hook_;
    }
    if (hook) {
      hook();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (unresolvable_.count(address.value)) {
      return Error(ErrorCode::DeviceNotFound, "Unknown device",
                   address.to_string());
    }
    auto it = details_.find(address.value);
    if (it != details_.end()) {
      return it->second;
    }
    return DeviceDetails{};
  }

  // ==========================================================================
  // Test controls
  // ==========================================================================

  /// Hand an advertisement to the watcher on the calling thread
  void deliver(const Advertisement &advertisement) {
    AdvertisementHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handler = advertisement_handler_;
    }
    if (handler) {
      handler(advertisement);
    }
  }

  /// The platform stops listening without being asked
  void halt() {
    StoppedHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      status_ = RadioStatus::Stopped;
      handler = stopped_handler_;
    }
    if (handler) {
      handler();
    }
  }

  void fail_start(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_start_ = fail;
  }

  void enable_resolution(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    resolution_enabled_ = enabled;
  }

  void set_details(const BluetoothAddress &address, DeviceDetails details) {
    std::lock_guard<std::mutex> lock(mutex_);
    details_[address.value] = std::move(details);
  }

  void make_unresolvable(const BluetoothAddress &address) {
    std::lock_guard<std::mutex> lock(mutex_);
    unresolvable_.insert(address.value);
  }

  /// Runs at the end of every successful start() call
  void set_start_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    start_hook_ = std::move(hook);
  }

  /// Runs inside every resolve_device() call, before it answers
  void set_resolve_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    resolve_hook_ = std::move(hook);
  }

  bool has_handlers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return advertisement_handler_ != nullptr && stopped_handler_ != nullptr;
  }

  ScanMode scan_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scan_mode_;
  }

  int start_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_calls_;
  }

  int stop_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_calls_;
  }

  int resolve_calls() const { return resolve_calls_.load(); }

private:
  mutable std::mutex mutex_;
  AdvertisementHandler advertisement_handler_;
  StoppedHandler stopped_handler_;
  RadioStatus status_ = RadioStatus::Stopped;
  ScanMode scan_mode_ = ScanMode::Active;

  bool fail_start_ = false;
  bool resolution_enabled_ = false;
  std::map<uint64_t, DeviceDetails> details_;
  std::set<uint64_t> unresolvable_;
  std::function<void()> start_hook_;
  std::function<void()> resolve_hook_;

  int start_calls_ = 0;
  int stop_calls_ = 0;
  std::atomic<int> resolve_calls_{0};
};

/**
 * @brief Clock advanced by hand
 */
class ManualClock {
public:
  ManualClock() : now_(TimePoint(std::chrono::seconds(1700000000))) {}

  TimePoint now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }

  void advance(std::chrono::seconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
  }

  ClockSource source() {
    return [this] { return now(); };
  }

private:
  mutable std::mutex mutex_;
  TimePoint now_;
};

inline Advertisement make_advertisement(uint64_t address,
                                        const std::string &name,
                                        TimePoint timestamp,
                                        int16_t rssi_dbm = -60,
                                        std::vector<std::string> uuids = {}) {
  Advertisement advertisement;
  advertisement.address = BluetoothAddress(address);
  advertisement.local_name = name;
  advertisement.timestamp = timestamp;
  advertisement.rssi_dbm = rssi_dbm;
  advertisement.service_uuids = std::move(uuids);
  return advertisement;
}

} // namespace test
} // namespace bluewatch

#endif // BLUEWATCH_TESTS_FAKE_RADIO_H
