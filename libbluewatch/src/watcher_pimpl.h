#ifndef BLUEWATCH_WATCHER_PIMPL_H
#define BLUEWATCH_WATCHER_PIMPL_H

#include "bluewatch/roster.h"
#include "bluewatch/watcher.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>
#include <vector>

namespace bluewatch {

class AdvertisementWatcher::Impl {
public:
  ~Impl();

  // Lifecycle state; taken before the roster lock, never held while
  // starting, stopping or destroying the radio, or while notifying
  mutable std::mutex mutex;
  bool initialized = false;
  WatcherState state = WatcherState::Stopped;
  std::atomic<bool> stop_requested{false};

  // Set while radio->start() runs unlocked; start and shutdown wait on it
  bool starting = false;
  bool start_interrupted = false;
  std::condition_variable start_cv;

  std::unique_ptr<AdvertisementRadio> radio;
  WatcherConfig config;
  ClockSource clock = [] { return Clock::now(); };
  std::atomic<int64_t> heartbeat_seconds{30};
  std::atomic<size_t> pending_resolutions{0};

  RosterStore roster;

  // Channels
  Signal<> started{"started"};
  Signal<StopReason> stopped{"stopped"};
  Signal<DeviceRecord> device_discovered{"device-discovered"};
  Signal<DeviceRecord> new_device_discovered{"new-device-discovered"};
  Signal<DeviceRecord> device_name_changed{"device-name-changed"};
  Signal<DeviceRecord> device_timed_out{"device-timed-out"};

  // Background sweeper. Each run has its own generation and exits once the
  // generation moves on.
  std::thread sweeper;
  std::vector<std::thread> retired_sweepers; // Stopped from their own thread
  std::mutex sweeper_mutex;
  std::condition_variable sweeper_cv;
  uint64_t sweeper_generation = 0;

  TimePoint now() const { return clock(); }

  std::chrono::seconds heartbeat() const {
    return std::chrono::seconds(heartbeat_seconds.load());
  }

  bool is_listening() const {
    std::lock_guard<std::mutex> lock(mutex);
    return state == WatcherState::Listening;
  }

  void handle_advertisement(const Advertisement &advertisement);
  void handle_radio_stopped();
  void finish_stop(StopReason reason);
  void announce_timeouts(const std::vector<DeviceRecord> &evicted);

  void start_sweeper();
  void stop_sweeper();
  void reap_sweepers();
  void sweeper_loop(uint64_t generation, std::chrono::milliseconds interval);
};

} // namespace bluewatch

#endif // BLUEWATCH_WATCHER_PIMPL_H
