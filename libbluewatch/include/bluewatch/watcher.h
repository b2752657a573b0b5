/**
 * @file watcher.h
 * @brief BLE advertisement watcher: lifecycle, roster and notifications
 *
 * The watcher listens to a platform radio, keeps a roster of every device
 * heard within the heartbeat timeout and tells observers what changed.
 *
 * Notification order for a single advertisement:
 *   1. device timed out   (once per device evicted by the leading sweep)
 *   2. device discovered  (every advertisement)
 *   3. device name changed (if a known name was replaced)
 *   4. new device discovered (first sighting)
 *
 * Observers run synchronously on the thread that produced the event and
 * never while the watcher holds one of its locks, so they may call back
 * into the watcher.
 */

#ifndef BLUEWATCH_WATCHER_H
#define BLUEWATCH_WATCHER_H

#include "config.h"
#include "device_record.h"
#include "error.h"
#include "platform.h"
#include "radio.h"
#include "signal.h"
#include "types.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace bluewatch {

// ============================================================================
// Watcher State
// ============================================================================

enum class WatcherState : uint8_t {
  /// Not listening (initial state)
  Stopped = 0,

  /// Radio engaged, advertisements are being ingested
  Listening = 1
};

BLUEWATCH_API const char *watcher_state_name(WatcherState state);

// ============================================================================
// Subscriptions
// ============================================================================

/// Notification channels
enum class WatcherEvent : uint8_t {
  Started = 0,
  Stopped = 1,
  DeviceDiscovered = 2,
  NewDeviceDiscovered = 3,
  DeviceNameChanged = 4,
  DeviceTimedOut = 5
};

BLUEWATCH_API const char *watcher_event_name(WatcherEvent event);

/**
 * @brief Handle identifying one observer on one channel
 */
struct Subscription {
  WatcherEvent event = WatcherEvent::Started;
  SubscriptionId id = 0;

  /// False for the handle returned when a null callback was passed
  bool is_valid() const { return id != 0; }
};

using StartedCallback = std::function<void()>;
using StoppedCallback = std::function<void(const StopReason &)>;
using DeviceCallback = std::function<void(const DeviceRecord &)>;

// ============================================================================
// Advertisement Watcher
// ============================================================================

/**
 * @brief Watches BLE advertisements and maintains the device roster
 *
 * Example usage:
 * @code
 *   auto radio = create_default_radio();
 *   if (!radio) { ... }
 *
 *   AdvertisementWatcher watcher;
 *   watcher.init(std::move(radio).value());
 *
 *   watcher.on_new_device_discovered([](const DeviceRecord &device) {
 *       std::cout << "New device: " << device.to_string() << std::endl;
 *   });
 *
 *   watcher.start_listening();
 * @endcode
 */
class BLUEWATCH_API AdvertisementWatcher {
public:
  AdvertisementWatcher();
  ~AdvertisementWatcher();

  // Non-copyable
  AdvertisementWatcher(const AdvertisementWatcher &) = delete;
  AdvertisementWatcher &operator=(const AdvertisementWatcher &) = delete;

  // ========================================================================
  // Initialization
  // ========================================================================

  /**
   * @brief Attach the radio and apply the configuration
   * @param radio Platform radio; the watcher takes ownership
   * @param config Watcher configuration (validated)
   * @param clock Source of "now" for timeouts; system clock when empty
   * @return InvalidArgument for a null radio, a null service catalog or an
   *         invalid config; AlreadyInitialized on a second call
   */
  Result<void> init(std::unique_ptr<AdvertisementRadio> radio,
                    const WatcherConfig &config = {},
                    ClockSource clock = {});

  /**
   * @brief Stop listening and release the radio
   */
  void shutdown();

  bool is_initialized() const;

  // ========================================================================
  // Lifecycle
  // ========================================================================

  /**
   * @brief Start listening for advertisements
   *
   * Does nothing if already listening. Fires "started" on success.
   */
  Result<void> start_listening();

  /**
   * @brief Stop listening and clear the roster
   *
   * Does nothing if already stopped. Fires "stopped" exactly once with
   * StopReason::Requested.
   */
  void stop_listening();

  bool is_listening() const;
  WatcherState get_state() const;

  // ========================================================================
  // Roster
  // ========================================================================

  std::chrono::seconds get_heartbeat_timeout() const;

  /**
   * @brief Change the heartbeat timeout; applies from the next sweep
   * @return InvalidArgument unless timeout is positive
   */
  Result<void> set_heartbeat_timeout(std::chrono::seconds timeout);

  /**
   * @brief Evict timed-out devices, then copy the roster in address order
   */
  std::vector<DeviceRecord> get_discovered_devices();

  /**
   * @brief Latest record for one device (after a sweep)
   */
  std::optional<DeviceRecord> get_device(const BluetoothAddress &address);

  /**
   * @brief Evict timed-out devices now
   * @return Number of devices evicted
   */
  size_t sweep_timeouts();

  // ========================================================================
  // Subscriptions
  // ========================================================================

  Subscription on_started(StartedCallback callback);
  Subscription on_stopped(StoppedCallback callback);
  Subscription on_device_discovered(DeviceCallback callback);
  Subscription on_new_device_discovered(DeviceCallback callback);
  Subscription on_device_name_changed(DeviceCallback callback);
  Subscription on_device_timed_out(DeviceCallback callback);

  /**
   * @brief Remove one observer
   * @return false if it was not subscribed
   */
  bool unsubscribe(const Subscription &subscription);

  class Impl;

private:
  std::unique_ptr<Impl> impl_;
};

} // namespace bluewatch

#endif // BLUEWATCH_WATCHER_H
