/**
 * @file watcher.cpp
 * @brief Advertisement watcher implementation
 */

#include "bluewatch/watcher.h"
#include "bluewatch/ingest.h"
#include "bluewatch/log.h"
#include "watcher_pimpl.h"
#include <spdlog/spdlog.h>

namespace bluewatch {

// ============================================================================
// Names
// ============================================================================

const char *watcher_state_name(WatcherState state) {
  switch (state) {
  case WatcherState::Stopped:
    return "Stopped";
  case WatcherState::Listening:
    return "Listening";
  default:
    return "Unknown";
  }
}

const char *watcher_event_name(WatcherEvent event) {
  switch (event) {
  case WatcherEvent::Started:
    return "started";
  case WatcherEvent::Stopped:
    return "stopped";
  case WatcherEvent::DeviceDiscovered:
    return "device-discovered";
  case WatcherEvent::NewDeviceDiscovered:
    return "new-device-discovered";
  case WatcherEvent::DeviceNameChanged:
    return "device-name-changed";
  case WatcherEvent::DeviceTimedOut:
    return "device-timed-out";
  default:
    return "unknown";
  }
}

// ============================================================================
// Impl
// ============================================================================

void AdvertisementWatcher::Impl::handle_advertisement(
    const Advertisement &advertisement) {
  AdvertisementRadio *source = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (state != WatcherState::Listening) {
      spdlog::trace("Ignoring advertisement from {} while stopped",
                    advertisement.address.to_string());
      return;
    }
    source = radio.get();
  }

  // The device lookup is a round trip to the platform stack; it must finish
  // before any roster lock is taken
  std::optional<DeviceDetails> details;
  if (config.resolve_device_details && source->supports_device_resolution()) {
    if (pending_resolutions.fetch_add(1) >= config.max_pending_resolutions) {
      pending_resolutions.fetch_sub(1);
      Error backlog(ErrorCode::ResolutionBacklog,
                    "Dropping advertisement from " +
                        advertisement.address.to_string(),
                    std::to_string(config.max_pending_resolutions) +
                        " lookups in flight");
      spdlog::debug("{}", backlog.to_string());
      return;
    }

    auto resolved =
        source->resolve_device(advertisement.address, config.resolve_timeout);
    pending_resolutions.fetch_sub(1);

    if (resolved.is_error()) {
      spdlog::debug("Dropping advertisement from {}: {}",
                    advertisement.address.to_string(),
                    resolved.error().to_string());
      return;
    }
    details = std::move(resolved).value();
  }

  std::optional<IngestResult> result;
  {
    // Holding the lifecycle lock keeps a concurrent stop from clearing the
    // roster underneath this event
    std::lock_guard<std::mutex> lock(mutex);
    if (state != WatcherState::Listening) {
      return;
    }
    result = ingest_advertisement(roster, advertisement, details,
                                  *config.services, now(), heartbeat());
  }

  announce_timeouts(result->timed_out);

  const DeviceRecord &record = result->record;
  spdlog::trace("Advertisement: {}", record.to_string());
  device_discovered.emit(record);

  if (result->name_changed) {
    spdlog::debug("Device name changed: {}", record.to_string());
    device_name_changed.emit(record);
  }

  if (result->is_new) {
    spdlog::debug("New device: {}", record.to_string());
    new_device_discovered.emit(record);
  }
}

void AdvertisementWatcher::Impl::handle_radio_stopped() {
  finish_stop(stop_requested.load() ? StopReason::Requested
                                    : StopReason::PlatformHalted);
}

void AdvertisementWatcher::Impl::finish_stop(StopReason reason) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (state == WatcherState::Stopped) {
      if (starting) {
        // The radio gave up before start() returned
        start_interrupted = true;
      }
      return;
    }
    state = WatcherState::Stopped;
    stop_requested = false;
    roster.clear();
  }

  if (reason == StopReason::PlatformHalted) {
    spdlog::warn("Radio stopped listening unexpectedly");
  } else {
    spdlog::info("Stopped listening");
  }
  stopped.emit(reason);
}

void AdvertisementWatcher::Impl::announce_timeouts(
    const std::vector<DeviceRecord> &evicted) {
  for (const auto &record : evicted) {
    spdlog::debug("Device timed out: {}", record.to_string());
    device_timed_out.emit(record);
  }
}

void AdvertisementWatcher::Impl::start_sweeper() {
  if (config.sweep_interval.count() <= 0) {
    return;
  }

  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex);
    generation = ++sweeper_generation;
  }
  std::chrono::milliseconds interval = config.sweep_interval;
  sweeper = std::thread(
      [this, generation, interval] { sweeper_loop(generation, interval); });
}

void AdvertisementWatcher::Impl::stop_sweeper() {
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex);
    ++sweeper_generation;
  }
  sweeper_cv.notify_all();

  if (!sweeper.joinable()) {
    return;
  }
  if (sweeper.get_id() == std::this_thread::get_id()) {
    // shutdown() called from an observer running on the sweeper; the loop
    // ends once the observer returns
    std::lock_guard<std::mutex> lock(sweeper_mutex);
    retired_sweepers.push_back(std::move(sweeper));
  } else {
    sweeper.join();
  }
}

void AdvertisementWatcher::Impl::reap_sweepers() {
  std::vector<std::thread> finished;
  {
    std::lock_guard<std::mutex> lock(sweeper_mutex);
    auto self = std::this_thread::get_id();
    for (auto it = retired_sweepers.begin(); it != retired_sweepers.end();) {
      if (it->get_id() != self) {
        finished.push_back(std::move(*it));
        it = retired_sweepers.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &thread : finished) {
    thread.join();
  }
}

void AdvertisementWatcher::Impl::sweeper_loop(
    uint64_t generation, std::chrono::milliseconds interval) {
  std::unique_lock<std::mutex> lock(sweeper_mutex);
  while (generation == sweeper_generation) {
    sweeper_cv.wait_for(lock, interval, [this, generation] {
      return generation != sweeper_generation;
    });
    if (generation != sweeper_generation) {
      break;
    }

    lock.unlock();
    std::vector<DeviceRecord> evicted;
    {
      // Same lock as ingestion, so a concurrent stop cannot slip between
      // the state check and the sweep
      std::lock_guard<std::mutex> state_lock(mutex);
      if (state == WatcherState::Listening) {
        evicted = roster.sweep_timeouts(now(), heartbeat());
      }
    }
    announce_timeouts(evicted);
    lock.lock();
  }
}

AdvertisementWatcher::Impl::~Impl() {
  stop_sweeper();
  reap_sweepers();

  // Only left when the watcher is destroyed from its own sweeper
  for (auto &thread : retired_sweepers) {
    thread.detach();
  }
}

// ============================================================================
// AdvertisementWatcher
// ============================================================================

AdvertisementWatcher::AdvertisementWatcher()
    : impl_(std::make_unique<Impl>()) {}

AdvertisementWatcher::~AdvertisementWatcher() { shutdown(); }

Result<void> AdvertisementWatcher::init(
    std::unique_ptr<AdvertisementRadio> radio, const WatcherConfig &config,
    ClockSource clock) {
  // Sweepers retired by an earlier shutdown() finish outside the lock
  impl_->reap_sweepers();

  std::lock_guard<std::mutex> lock(impl_->mutex);

  if (impl_->initialized) {
    return Error(ErrorCode::AlreadyInitialized,
                 "AdvertisementWatcher already initialized");
  }

  BLUEWATCH_REQUIRE(radio != nullptr, ErrorCode::InvalidArgument,
                    "Radio is null");
  BLUEWATCH_TRY(config.validate());
  BLUEWATCH_TRY(set_log_level(config.log_level));

  impl_->config = config;
  impl_->heartbeat_seconds = config.heartbeat_timeout.count();
  if (clock) {
    impl_->clock = std::move(clock);
  }

  Impl *impl = impl_.get();
  radio->on_advertisement_received([impl](const Advertisement &advertisement) {
    impl->handle_advertisement(advertisement);
  });
  radio->on_listener_stopped([impl]() { impl->handle_radio_stopped(); });
  impl_->radio = std::move(radio);

  impl_->start_sweeper();
  impl_->initialized = true;

  spdlog::debug("Watcher initialized (heartbeat {}s, scan mode {})",
                config.heartbeat_timeout.count(),
                scan_mode_name(config.scan_mode));
  return Result<void>::ok();
}

void AdvertisementWatcher::shutdown() {
  if (!is_initialized()) {
    return;
  }

  stop_listening();
  impl_->stop_sweeper();

  std::unique_ptr<AdvertisementRadio> radio;
  bool raced_start = false;
  {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->start_cv.wait(lock, [this] { return !impl_->starting; });
    if (!impl_->initialized) {
      return;
    }

    if (impl_->state == WatcherState::Listening) {
      // A concurrent start_listening() finished after the stop above
      raced_start = true;
      impl_->state = WatcherState::Stopped;
      impl_->roster.clear();
    }
    radio = std::move(impl_->radio);
    impl_->initialized = false;
  }

  // Destroying the radio may join a thread that is still notifying
  // observers, and those may call back into the watcher
  radio->on_advertisement_received(nullptr);
  radio->on_listener_stopped(nullptr);
  if (raced_start) {
    radio->stop();
    spdlog::info("Stopped listening");
    impl_->stopped.emit(StopReason::Requested);
  }
  radio.reset();
}

bool AdvertisementWatcher::is_initialized() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->initialized;
}

Result<void> AdvertisementWatcher::start_listening() {
  AdvertisementRadio *radio = nullptr;
  ScanMode mode = ScanMode::Active;
  {
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->start_cv.wait(lock, [this] { return !impl_->starting; });

    if (!impl_->initialized) {
      return Error(ErrorCode::NotInitialized,
                   "AdvertisementWatcher not initialized");
    }

    if (impl_->state == WatcherState::Listening) {
      return Result<void>::ok();
    }

    impl_->starting = true;
    impl_->start_interrupted = false;
    impl_->stop_requested = false;
    radio = impl_->radio.get();
    mode = impl_->config.scan_mode;
  }

  // Starting may join a platform thread that is still running stopped
  // observers, so the lifecycle lock is released around it
  radio->set_scan_mode(mode);
  auto result = radio->start();

  bool interrupted = false;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->starting = false;
    interrupted = impl_->start_interrupted;
    impl_->start_interrupted = false;
    if (result.is_ok() && !interrupted) {
      impl_->state = WatcherState::Listening;
    }
  }
  impl_->start_cv.notify_all();

  if (result.is_error()) {
    spdlog::warn("Failed to start listening: {}", result.error().to_string());
    return result;
  }
  if (interrupted) {
    spdlog::warn("Radio stopped while starting");
    return Error(ErrorCode::ScanFailed, "Radio stopped while starting");
  }

  spdlog::info("Started listening ({} scan)", scan_mode_name(mode));
  impl_->started.emit();
  return Result<void>::ok();
}

void AdvertisementWatcher::stop_listening() {
  AdvertisementRadio *radio = nullptr;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->initialized || impl_->state == WatcherState::Stopped) {
      return;
    }
    impl_->stop_requested = true;
    radio = impl_->radio.get();
  }

  // The radio may report its own stop from inside stop(); finish_stop()
  // makes whichever call comes second a no-op
  radio->stop();
  impl_->finish_stop(StopReason::Requested);
}

bool AdvertisementWatcher::is_listening() const {
  return impl_->is_listening();
}

WatcherState AdvertisementWatcher::get_state() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->state;
}

std::chrono::seconds AdvertisementWatcher::get_heartbeat_timeout() const {
  return impl_->heartbeat();
}

Result<void>
AdvertisementWatcher::set_heartbeat_timeout(std::chrono::seconds timeout) {
  BLUEWATCH_TRY(check_heartbeat_timeout(timeout));
  impl_->heartbeat_seconds = timeout.count();
  spdlog::debug("Heartbeat timeout set to {}s", timeout.count());
  return Result<void>::ok();
}

std::vector<DeviceRecord> AdvertisementWatcher::get_discovered_devices() {
  std::vector<DeviceRecord> evicted;
  auto devices =
      impl_->roster.snapshot(impl_->now(), impl_->heartbeat(), &evicted);
  impl_->announce_timeouts(evicted);
  return devices;
}

std::optional<DeviceRecord>
AdvertisementWatcher::get_device(const BluetoothAddress &address) {
  sweep_timeouts();
  return impl_->roster.find(address);
}

size_t AdvertisementWatcher::sweep_timeouts() {
  auto evicted = impl_->roster.sweep_timeouts(impl_->now(), impl_->heartbeat());
  impl_->announce_timeouts(evicted);
  return evicted.size();
}

Subscription AdvertisementWatcher::on_started(StartedCallback callback) {
  return {WatcherEvent::Started, impl_->started.subscribe(std::move(callback))};
}

Subscription AdvertisementWatcher::on_stopped(StoppedCallback callback) {
  return {WatcherEvent::Stopped, impl_->stopped.subscribe(std::move(callback))};
}

Subscription
AdvertisementWatcher::on_device_discovered(DeviceCallback callback) {
  return {WatcherEvent::DeviceDiscovered,
          impl_->device_discovered.subscribe(std::move(callback))};
}

Subscription
AdvertisementWatcher::on_new_device_discovered(DeviceCallback callback) {
  return {WatcherEvent::NewDeviceDiscovered,
          impl_->new_device_discovered.subscribe(std::move(callback))};
}

Subscription
AdvertisementWatcher::on_device_name_changed(DeviceCallback callback) {
  return {WatcherEvent::DeviceNameChanged,
          impl_->device_name_changed.subscribe(std::move(callback))};
}

Subscription
AdvertisementWatcher::on_device_timed_out(DeviceCallback callback) {
  return {WatcherEvent::DeviceTimedOut,
          impl_->device_timed_out.subscribe(std::move(callback))};
}

bool AdvertisementWatcher::unsubscribe(const Subscription &subscription) {
  switch (subscription.event) {
  case WatcherEvent::Started:
    return impl_->started.unsubscribe(subscription.id);
  case WatcherEvent::Stopped:
    return impl_->stopped.unsubscribe(subscription.id);
  case WatcherEvent::DeviceDiscovered:
    return impl_->device_discovered.unsubscribe(subscription.id);
  case WatcherEvent::NewDeviceDiscovered:
    return impl_->new_device_discovered.unsubscribe(subscription.id);
  case WatcherEvent::DeviceNameChanged:
    return impl_->device_name_changed.unsubscribe(subscription.id);
  case WatcherEvent::DeviceTimedOut:
    return impl_->device_timed_out.unsubscribe(subscription.id);
  default:
    return false;
  }
}

} // namespace bluewatch
