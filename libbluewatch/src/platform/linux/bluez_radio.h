/**
 * @file bluez_radio.h
 * @brief BlueZ implementation of AdvertisementRadio
 *
 * Scanning uses org.bluez.Adapter1.StartDiscovery with an LE-only filter.
 * Advertisements arrive as InterfacesAdded / PropertiesChanged signals on
 * a private bus connection serviced by a dispatch thread; method calls go
 * through a second (shared) connection so device lookups made from inside
 * a signal handler never re-enter the dispatch loop.
 */

#ifndef BLUEWATCH_PLATFORM_LINUX_BLUEZ_RADIO_H
#define BLUEWATCH_PLATFORM_LINUX_BLUEZ_RADIO_H

#include "bluewatch/radio.h"
#include "dbus_helpers.h"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

namespace bluewatch {
namespace platform {

// BlueZ D-Bus constants
constexpr const char *BLUEZ_SERVICE = "org.bluez";
constexpr const char *BLUEZ_ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char *BLUEZ_DEVICE_IFACE = "org.bluez.Device1";
constexpr const char *DBUS_OBJECT_MANAGER_IFACE =
    "org.freedesktop.DBus.ObjectManager";
constexpr const char *DBUS_PROPERTIES_IFACE = "org.freedesktop.DBus.Properties";

/**
 * @brief BlueZ adapter state
 */
struct BlueZAdapter {
  std::string object_path; // e.g., "/org/bluez/hci0"
  std::string address;     // MAC address
  std::string name;        // Adapter name
  bool powered = false;    // Is adapter powered on
};

/**
 * @brief Find a BlueZ adapter
 * @param adapter_name "hci0" etc.; empty selects the first adapter
 */
Result<BlueZAdapter> find_adapter(DBusConnection *conn,
                                  const std::string &adapter_name);

/**
 * @brief Restrict discovery to LE and report every advertisement
 */
Result<void> set_le_discovery_filter(DBusConnection *conn,
                                     const std::string &adapter_path);

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path);

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path);

/**
 * @brief Object path BlueZ uses for a device under an adapter
 * @return e.g. "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF"
 */
std::string device_object_path(const std::string &adapter_path,
                               const BluetoothAddress &address);

/**
 * @brief Recover the address from a device object path
 */
std::optional<BluetoothAddress>
address_from_object_path(const std::string &path);

class BlueZRadio : public AdvertisementRadio {
public:
  explicit BlueZRadio(std::string adapter_name);
  ~BlueZRadio() override;

  BlueZRadio(const BlueZRadio &) = delete;
  BlueZRadio &operator=(const BlueZRadio &) = delete;

  void set_scan_mode(ScanMode mode) override;
  void on_advertisement_received(AdvertisementHandler handler) override;
  void on_listener_stopped(StoppedHandler handler) override;

  Result<void> start() override;
  void stop() override;
  RadioStatus current_status() const override;

  bool supports_device_resolution() const override { return true; }
  Result<DeviceDetails>
  resolve_device(const BluetoothAddress &address,
                 std::chrono::milliseconds timeout) override;

private:
  static DBusHandlerResult filter_thunk(DBusConnection *conn,
                                        DBusMessage *msg, void *user_data);
  void handle_message(DBusMessage *msg);
  void handle_device_properties(const std::string &path,
                                const PropertyMap &properties);
  void handle_adapter_properties(const PropertyMap &properties);

  Result<void> open_signal_connection();
  void close_signal_connection();
  void join_dispatch_thread();
  void dispatch_loop();
  void halt();
  void notify_stopped();

  const std::string adapter_name_;

  // Held across start/stop, never by the dispatch thread
  std::mutex lifecycle_mutex_;
  DBusConnectionWrapper signal_conn_;
  ScanMode scan_mode_ = ScanMode::Active;

  // Guards what resolve_device() reads from the dispatch thread
  mutable std::mutex adapter_mutex_;
  DBusConnectionWrapper call_conn_;
  BlueZAdapter adapter_;

  std::atomic<bool> scanning_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> stopped_notified_{true};
  std::thread dispatch_thread_;

  mutable std::mutex handler_mutex_;
  AdvertisementHandler advertisement_handler_;
  StoppedHandler stopped_handler_;
};

} // namespace platform
} // namespace bluewatch

#endif // BLUEWATCH_PLATFORM_LINUX_BLUEZ_RADIO_H
