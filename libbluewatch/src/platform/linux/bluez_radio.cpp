/**
 * @file bluez_radio.cpp
 * @brief BlueZ advertisement radio over libdbus
 */

#include "bluez_radio.h"
#include "bluewatch/config.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace bluewatch {

namespace platform {

namespace {

constexpr int DISPATCH_POLL_MS = 100;

std::string match_rule(const char *iface, const char *member) {
  std::string rule = "type='signal',sender='";
  rule += BLUEZ_SERVICE;
  rule += "',interface='";
  rule += iface;
  rule += "',member='";
  rule += member;
  rule += "'";
  return rule;
}

const std::string &interfaces_added_rule() {
  static const std::string rule =
      match_rule(DBUS_OBJECT_MANAGER_IFACE, "InterfacesAdded");
  return rule;
}

const std::string &properties_changed_rule() {
  static const std::string rule =
      match_rule(DBUS_PROPERTIES_IFACE, "PropertiesChanged");
  return rule;
}

} // namespace

// ============================================================================
// BlueZ Adapter Discovery
// ============================================================================

Result<BlueZAdapter> find_adapter(DBusConnection *conn,
                                  const std::string &adapter_name) {
  auto reply = call_method(conn, BLUEZ_SERVICE, "/", DBUS_OBJECT_MANAGER_IFACE,
                           "GetManagedObjects");

  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter, dict_iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter)) {
    return Error(ErrorCode::PlatformError, "Empty reply from BlueZ");
  }

  if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
    return Error(ErrorCode::PlatformError, "Unexpected reply format");
  }

  dbus_message_iter_recurse(&iter, &dict_iter);

  while (dbus_message_iter_get_arg_type(&dict_iter) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry_iter, iface_dict_iter;
    dbus_message_iter_recurse(&dict_iter, &entry_iter);

    const char *path = nullptr;
    dbus_message_iter_get_basic(&entry_iter, &path);
    dbus_message_iter_next(&entry_iter);

    if (!path || dbus_message_iter_get_arg_type(&entry_iter) != DBUS_TYPE_ARRAY) {
      dbus_message_iter_next(&dict_iter);
      continue;
    }

    std::string object_path = path;
    std::string suffix = "/" + adapter_name;
    bool wanted = adapter_name.empty() ||
                  (object_path.size() >= suffix.size() &&
                   object_path.compare(object_path.size() - suffix.size(),
                                       suffix.size(), suffix) == 0);

    dbus_message_iter_recurse(&entry_iter, &iface_dict_iter);

    while (wanted && dbus_message_iter_get_arg_type(&iface_dict_iter) ==
                         DBUS_TYPE_DICT_ENTRY) {
      DBusMessageIter iface_entry;
      dbus_message_iter_recurse(&iface_dict_iter, &iface_entry);

      const char *iface = nullptr;
      dbus_message_iter_get_basic(&iface_entry, &iface);
      dbus_message_iter_next(&iface_entry);

      if (iface && std::strcmp(iface, BLUEZ_ADAPTER_IFACE) == 0) {
        PropertyMap properties = read_property_dict(&iface_entry);

        BlueZAdapter adapter;
        adapter.object_path = object_path;
        adapter.address =
            get_property<std::string>(properties, "Address").value_or("");
        adapter.name = get_property<std::string>(properties, "Name")
                           .value_or(object_path.substr(
                               object_path.find_last_of('/') + 1));
        adapter.powered =
            get_property<bool>(properties, "Powered").value_or(false);
        return adapter;
      }

      dbus_message_iter_next(&iface_dict_iter);
    }

    dbus_message_iter_next(&dict_iter);
  }

  if (adapter_name.empty()) {
    return Error(ErrorCode::AdapterNotFound, "No Bluetooth adapter found");
  }
  return Error(ErrorCode::AdapterNotFound, "Bluetooth adapter not found",
               adapter_name);
}

// ============================================================================
// Adapter Control
// ============================================================================

Result<void> set_le_discovery_filter(DBusConnection *conn,
                                     const std::string &adapter_path) {
  DBusMessageWrapper msg(dbus_message_new_method_call(
      BLUEZ_SERVICE, adapter_path.c_str(), BLUEZ_ADAPTER_IFACE,
      "SetDiscoveryFilter"));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  DBusMessageIter iter, dict;
  dbus_message_iter_init_append(msg.get(), &iter);
  dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

  const char *transport = "le";
  append_dict_entry(&dict, "Transport", DBUS_TYPE_STRING, &transport);

  // Report every advertisement, not only the first per device
  dbus_bool_t duplicates = TRUE;
  append_dict_entry(&dict, "DuplicateData", DBUS_TYPE_BOOLEAN, &duplicates);

  dbus_message_iter_close_container(&iter, &dict);

  auto reply = send_and_wait(conn, msg.get());
  if (reply.is_error()) {
    return reply.error();
  }
  return Result<void>::ok();
}

Result<void> start_discovery(DBusConnection *conn,
                             const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StartDiscovery");

  if (result.is_error()) {
    // Check if already discovering (not an error)
    if (result.error().message.find("InProgress") != std::string::npos) {
      return Result<void>::ok();
    }
    Error error = result.error();
    if (error.code == ErrorCode::PlatformError) {
      error.code = ErrorCode::ScanFailed;
    }
    return error;
  }

  return Result<void>::ok();
}

Result<void> stop_discovery(DBusConnection *conn,
                            const std::string &adapter_path) {
  auto result = call_method(conn, BLUEZ_SERVICE, adapter_path.c_str(),
                            BLUEZ_ADAPTER_IFACE, "StopDiscovery");

  if (result.is_error()) {
    // Not discovering is not an error
    if (result.error().message.find("Not") != std::string::npos) {
      return Result<void>::ok();
    }
    return result.error();
  }

  return Result<void>::ok();
}

// ============================================================================
// Object Paths
// ============================================================================

std::string device_object_path(const std::string &adapter_path,
                               const BluetoothAddress &address) {
  std::string text = address.to_string();
  std::replace(text.begin(), text.end(), ':', '_');
  return adapter_path + "/dev_" + text;
}

std::optional<BluetoothAddress>
address_from_object_path(const std::string &path) {
  auto pos = path.rfind("/dev_");
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  std::string text = path.substr(pos + 5);
  std::replace(text.begin(), text.end(), '_', ':');
  return BluetoothAddress::from_string(text);
}

// ============================================================================
// BlueZRadio
// ============================================================================

BlueZRadio::BlueZRadio(std::string adapter_name)
    : adapter_name_(std::move(adapter_name)) {}

BlueZRadio::~BlueZRadio() {
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    advertisement_handler_ = nullptr;
    stopped_handler_ = nullptr;
  }
  stop();
}

void BlueZRadio::set_scan_mode(ScanMode mode) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  scan_mode_ = mode;
}

void BlueZRadio::on_advertisement_received(AdvertisementHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  advertisement_handler_ = std::move(handler);
}

void BlueZRadio::on_listener_stopped(StoppedHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  stopped_handler_ = std::move(handler);
}

RadioStatus BlueZRadio::current_status() const {
  return scanning_ ? RadioStatus::Started : RadioStatus::Stopped;
}

Result<void> BlueZRadio::start() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (scanning_) {
    return Result<void>::ok();
  }

  // Left over from a platform halt
  join_dispatch_thread();
  close_signal_connection();

  if (!call_conn_) {
    auto conn = get_system_bus();
    if (conn.is_error()) {
      return conn.error();
    }
    std::lock_guard<std::mutex> adapter_lock(adapter_mutex_);
    call_conn_ = std::move(conn).value();
  }

  auto adapter = find_adapter(call_conn_.get(), adapter_name_);
  if (adapter.is_error()) {
    return adapter.error();
  }
  {
    std::lock_guard<std::mutex> adapter_lock(adapter_mutex_);
    adapter_ = adapter.value();
  }

  if (!adapter_.powered) {
    return Error(ErrorCode::BluetoothOff, "Bluetooth adapter is powered off",
                 adapter_.object_path);
  }

  if (scan_mode_ == ScanMode::Passive) {
    // BlueZ discovery always scans actively
    spdlog::debug("Passive scanning requested; BlueZ discovery is active");
  }

  BLUEWATCH_TRY(open_signal_connection());

  auto filter = set_le_discovery_filter(call_conn_.get(), adapter_.object_path);
  if (filter.is_error()) {
    spdlog::warn("SetDiscoveryFilter failed: {}", filter.error().to_string());
  }

  auto discovery = start_discovery(call_conn_.get(), adapter_.object_path);
  if (discovery.is_error()) {
    close_signal_connection();
    return discovery.error();
  }

  stop_requested_ = false;
  stopped_notified_ = false;
  scanning_ = true;
  dispatch_thread_ = std::thread(&BlueZRadio::dispatch_loop, this);

  spdlog::info("BlueZ discovery started on {} ({})", adapter_.name,
               adapter_.object_path);
  return Result<void>::ok();
}

void BlueZRadio::stop() {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (!scanning_ && !dispatch_thread_.joinable() && !signal_conn_) {
      return;
    }

    stop_requested_ = true;

    if (scanning_ && call_conn_) {
      auto result = stop_discovery(call_conn_.get(), adapter_.object_path);
      if (result.is_error()) {
        spdlog::warn("StopDiscovery failed: {}", result.error().to_string());
      }
    }

    join_dispatch_thread();
    close_signal_connection();
    scanning_ = false;
  }

  notify_stopped();
}

Result<DeviceDetails>
BlueZRadio::resolve_device(const BluetoothAddress &address,
                           std::chrono::milliseconds timeout) {
  // D-Bus takes the timeout as an int
  BLUEWATCH_TRY(check_resolve_timeout(timeout));

  std::string path;
  {
    std::lock_guard<std::mutex> lock(adapter_mutex_);
    if (!call_conn_ || adapter_.object_path.empty()) {
      return Error(ErrorCode::InvalidState, "Radio has not been started");
    }
    path = device_object_path(adapter_.object_path, address);
  }

  DBusMessageWrapper msg(dbus_message_new_method_call(
      BLUEZ_SERVICE, path.c_str(), DBUS_PROPERTIES_IFACE, "GetAll"));
  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  const char *iface = BLUEZ_DEVICE_IFACE;
  dbus_message_append_args(msg.get(), DBUS_TYPE_STRING, &iface,
                           DBUS_TYPE_INVALID);

  auto reply = send_and_wait(call_conn_.get(), msg.get(),
                             static_cast<int>(timeout.count()));
  if (reply.is_error()) {
    return reply.error();
  }

  DBusMessageIter iter;
  if (!dbus_message_iter_init(reply.value().get(), &iter)) {
    return Error(ErrorCode::PlatformError, "Empty reply from BlueZ");
  }

  PropertyMap properties = read_property_dict(&iter);

  DeviceDetails details;
  details.display_name =
      get_property<std::string>(properties, "Name").value_or("");
  details.connected =
      get_property<bool>(properties, "Connected").value_or(false);
  details.paired = get_property<bool>(properties, "Paired").value_or(false);
  bool blocked = get_property<bool>(properties, "Blocked").value_or(false);
  details.can_pair = !details.paired && !blocked;
  details.device_id = path;
  return details;
}

// ============================================================================
// Signal Handling
// ============================================================================

DBusHandlerResult BlueZRadio::filter_thunk(DBusConnection *conn,
                                           DBusMessage *msg, void *user_data) {
  BLUEWATCH_UNUSED(conn);
  static_cast<BlueZRadio *>(user_data)->handle_message(msg);
  return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

void BlueZRadio::handle_message(DBusMessage *msg) {
  if (stop_requested_ || !scanning_) {
    return;
  }

  DBusMessageIter iter;

  if (dbus_message_is_signal(msg, DBUS_OBJECT_MANAGER_IFACE,
                             "InterfacesAdded")) {
    if (!dbus_message_iter_init(msg, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_OBJECT_PATH) {
      return;
    }

    const char *path = nullptr;
    dbus_message_iter_get_basic(&iter, &path);
    dbus_message_iter_next(&iter);
    if (!path || dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
      return;
    }

    DBusMessageIter ifaces;
    dbus_message_iter_recurse(&iter, &ifaces);
    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
      DBusMessageIter entry;
      dbus_message_iter_recurse(&ifaces, &entry);

      const char *iface = nullptr;
      dbus_message_iter_get_basic(&entry, &iface);
      dbus_message_iter_next(&entry);

      if (iface && std::strcmp(iface, BLUEZ_DEVICE_IFACE) == 0) {
        handle_device_properties(path, read_property_dict(&entry));
      }
      dbus_message_iter_next(&ifaces);
    }
    return;
  }

  if (dbus_message_is_signal(msg, DBUS_PROPERTIES_IFACE,
                             "PropertiesChanged")) {
    const char *path = dbus_message_get_path(msg);
    if (!path || !dbus_message_iter_init(msg, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) {
      return;
    }

    const char *iface = nullptr;
    dbus_message_iter_get_basic(&iter, &iface);
    dbus_message_iter_next(&iter);
    if (!iface) {
      return;
    }

    if (std::strcmp(iface, BLUEZ_DEVICE_IFACE) == 0) {
      handle_device_properties(path, read_property_dict(&iter));
    } else if (std::strcmp(iface, BLUEZ_ADAPTER_IFACE) == 0 &&
               adapter_.object_path == path) {
      handle_adapter_properties(read_property_dict(&iter));
    }
  }
}

void BlueZRadio::handle_device_properties(const std::string &path,
                                          const PropertyMap &properties) {
  // Cached devices and plain property updates carry no RSSI; only a
  // freshly received advertisement does
  auto rssi = get_property<int64_t>(properties, "RSSI");
  if (!rssi) {
    return;
  }

  if (path.compare(0, adapter_.object_path.size() + 1,
                   adapter_.object_path + "/") != 0) {
    return;
  }

  std::optional<BluetoothAddress> address;
  if (auto text = get_property<std::string>(properties, "Address")) {
    address = BluetoothAddress::from_string(*text);
  }
  if (!address) {
    address = address_from_object_path(path);
  }
  if (!address) {
    spdlog::debug("Ignoring advertisement from unparsable path {}", path);
    return;
  }

  Advertisement advertisement;
  advertisement.address = *address;
  advertisement.local_name =
      get_property<std::string>(properties, "Name").value_or("");
  advertisement.timestamp = Clock::now();
  advertisement.rssi_dbm = static_cast<int16_t>(*rssi);
  advertisement.service_uuids =
      get_property<std::vector<std::string>>(properties, "UUIDs")
          .value_or(std::vector<std::string>{});

  AdvertisementHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = advertisement_handler_;
  }
  if (handler) {
    handler(advertisement);
  }
}

void BlueZRadio::handle_adapter_properties(const PropertyMap &properties) {
  auto discovering = get_property<bool>(properties, "Discovering");
  auto powered = get_property<bool>(properties, "Powered");

  if ((discovering && !*discovering) || (powered && !*powered)) {
    spdlog::warn("Adapter {} stopped discovery ({})", adapter_.name,
                 powered && !*powered ? "powered off" : "discovery ended");
    halt();
  }
}

// ============================================================================
// Dispatch
// ============================================================================

Result<void> BlueZRadio::open_signal_connection() {
  auto conn = open_private_system_bus();
  if (conn.is_error()) {
    return conn.error();
  }
  signal_conn_ = std::move(conn).value();

  for (const std::string *rule :
       {&interfaces_added_rule(), &properties_changed_rule()}) {
    DBusErrorWrapper error;
    dbus_bus_add_match(signal_conn_.get(), rule->c_str(), error.get());
    if (error.is_set()) {
      Error err = error.to_error();
      signal_conn_.reset();
      return err;
    }
  }

  if (!dbus_connection_add_filter(signal_conn_.get(), &BlueZRadio::filter_thunk,
                                  this, nullptr)) {
    signal_conn_.reset();
    return Error(ErrorCode::PlatformError, "Failed to install D-Bus filter");
  }

  return Result<void>::ok();
}

void BlueZRadio::close_signal_connection() {
  if (!signal_conn_) {
    return;
  }

  dbus_connection_remove_filter(signal_conn_.get(), &BlueZRadio::filter_thunk,
                                this);
  // Rules die with the private connection; removal is best effort
  dbus_bus_remove_match(signal_conn_.get(), interfaces_added_rule().c_str(),
                        nullptr);
  dbus_bus_remove_match(signal_conn_.get(), properties_changed_rule().c_str(),
                        nullptr);
  signal_conn_.reset();
}

void BlueZRadio::join_dispatch_thread() {
  if (!dispatch_thread_.joinable()) {
    return;
  }
  if (dispatch_thread_.get_id() == std::this_thread::get_id()) {
    dispatch_thread_.detach();
  } else {
    dispatch_thread_.join();
  }
}

void BlueZRadio::dispatch_loop() {
  DBusConnection *conn = signal_conn_.get();

  while (!stop_requested_ && scanning_) {
    if (!dbus_connection_read_write_dispatch(conn, DISPATCH_POLL_MS)) {
      spdlog::error("Lost connection to the system bus");
      halt();
      break;
    }
  }
}

void BlueZRadio::halt() {
  if (stop_requested_) {
    return;
  }
  scanning_ = false;
  notify_stopped();
}

void BlueZRadio::notify_stopped() {
  if (stopped_notified_.exchange(true)) {
    return;
  }

  StoppedHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = stopped_handler_;
  }
  if (handler) {
    handler();
  }
}

} // namespace platform

// ============================================================================
// Factory
// ============================================================================

Result<std::unique_ptr<AdvertisementRadio>>
create_default_radio(const std::string &adapter) {
  std::unique_ptr<AdvertisementRadio> radio =
      std::make_unique<platform::BlueZRadio>(adapter);
  return Result<std::unique_ptr<AdvertisementRadio>>(std::move(radio));
}

} // namespace bluewatch
