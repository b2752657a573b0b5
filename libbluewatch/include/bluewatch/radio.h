/**
 * @file radio.h
 * @brief Platform radio abstraction
 *
 * The watcher consumes advertisements through this interface. The Linux
 * build provides a BlueZ implementation; tests drive a scripted one.
 *
 * Handlers are invoked on the radio's own thread(s). The stopped handler
 * fires whenever the radio stops listening, whether stop() was called or
 * the platform halted on its own.
 */

#ifndef BLUEWATCH_RADIO_H
#define BLUEWATCH_RADIO_H

#include "error.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace bluewatch {

class BLUEWATCH_API AdvertisementRadio {
public:
  using AdvertisementHandler = std::function<void(const Advertisement &)>;
  using StoppedHandler = std::function<void()>;

  virtual ~AdvertisementRadio() = default;

  /// Takes effect on the next start()
  virtual void set_scan_mode(ScanMode mode) = 0;

  virtual void on_advertisement_received(AdvertisementHandler handler) = 0;
  virtual void on_listener_stopped(StoppedHandler handler) = 0;

  virtual Result<void> start() = 0;
  virtual void stop() = 0;
  virtual RadioStatus current_status() const = 0;

  /// Whether resolve_device() can return details
  virtual bool supports_device_resolution() const { return false; }

  /**
   * @brief Query the platform device stack for one device
   * @return Details, or an error (DeviceNotFound when unknown)
   */
  virtual Result<DeviceDetails>
  resolve_device(const BluetoothAddress &address,
                 std::chrono::milliseconds timeout) {
    BLUEWATCH_UNUSED(address);
    BLUEWATCH_UNUSED(timeout);
    return Error(ErrorCode::NotSupported, "Device resolution not supported");
  }
};

/**
 * @brief Create the radio for this platform
 * @param adapter Adapter name ("hci0"); empty selects the first one
 * @return BlueZ radio, or NotSupported when built without D-Bus
 */
BLUEWATCH_API Result<std::unique_ptr<AdvertisementRadio>>
create_default_radio(const std::string &adapter = "");

} // namespace bluewatch

#endif // BLUEWATCH_RADIO_H
