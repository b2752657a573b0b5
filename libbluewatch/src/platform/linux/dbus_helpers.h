/**
 * @file dbus_helpers.h
 * @brief D-Bus utility functions for the BlueZ backend
 *
 * RAII wrappers for libdbus handles plus helpers to call methods and to
 * decode the a{sv} property dictionaries BlueZ uses everywhere.
 */

#ifndef BLUEWATCH_PLATFORM_LINUX_DBUS_HELPERS_H
#define BLUEWATCH_PLATFORM_LINUX_DBUS_HELPERS_H

#include "bluewatch/error.h"
#include <cstdint>
#include <cstring>
#include <dbus/dbus.h>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bluewatch {
namespace platform {

// ============================================================================
// D-Bus Connection RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusConnection
 *
 * Private connections (dbus_bus_get_private) must be closed before their
 * last reference goes away; shared ones must never be closed.
 */
class DBusConnectionWrapper {
public:
  DBusConnectionWrapper() = default;

  explicit DBusConnectionWrapper(DBusConnection *conn, bool is_private = false)
      : conn_(conn), private_(is_private) {}

  ~DBusConnectionWrapper() { reset(); }

  // Move-only
  DBusConnectionWrapper(DBusConnectionWrapper &&other) noexcept
      : conn_(other.conn_), private_(other.private_) {
    other.conn_ = nullptr;
  }

  DBusConnectionWrapper &operator=(DBusConnectionWrapper &&other) noexcept {
    if (this != &other) {
      reset();
      conn_ = other.conn_;
      private_ = other.private_;
      other.conn_ = nullptr;
    }
    return *this;
  }

  DBusConnectionWrapper(const DBusConnectionWrapper &) = delete;
  DBusConnectionWrapper &operator=(const DBusConnectionWrapper &) = delete;

  void reset() {
    if (conn_) {
      if (private_) {
        dbus_connection_close(conn_);
      }
      dbus_connection_unref(conn_);
      conn_ = nullptr;
    }
  }

  DBusConnection *get() const { return conn_; }
  operator bool() const { return conn_ != nullptr; }

private:
  DBusConnection *conn_ = nullptr;
  bool private_ = false;
};

// ============================================================================
// D-Bus Message RAII Wrapper
// ============================================================================

/**
 * @brief RAII wrapper for DBusMessage
 */
class DBusMessageWrapper {
public:
  DBusMessageWrapper() = default;

  explicit DBusMessageWrapper(DBusMessage *msg) : msg_(msg) {}

  ~DBusMessageWrapper() {
    if (msg_) {
      dbus_message_unref(msg_);
    }
  }

  // Move-only
  DBusMessageWrapper(DBusMessageWrapper &&other) noexcept : msg_(other.msg_) {
    other.msg_ = nullptr;
  }

  DBusMessageWrapper &operator=(DBusMessageWrapper &&other) noexcept {
    if (this != &other) {
      if (msg_) {
        dbus_message_unref(msg_);
      }
      msg_ = other.msg_;
      other.msg_ = nullptr;
    }
    return *this;
  }

  DBusMessageWrapper(const DBusMessageWrapper &) = delete;
  DBusMessageWrapper &operator=(const DBusMessageWrapper &) = delete;

  DBusMessage *get() const { return msg_; }
  operator bool() const { return msg_ != nullptr; }

private:
  DBusMessage *msg_ = nullptr;
};

// ============================================================================
// D-Bus Error Helpers
// ============================================================================

/**
 * @brief Convert DBusError to a bluewatch Error
 *
 * Well-known BlueZ and bus error names map onto specific codes; anything
 * else becomes PlatformError.
 */
inline Error dbus_error_to_bluewatch(const DBusError &err) {
  if (!dbus_error_is_set(&err)) {
    return Error(ErrorCode::PlatformError, "D-Bus call failed");
  }

  std::string name = err.name ? err.name : "";
  std::string message = name.empty() ? "D-Bus error" : name;
  if (err.message) {
    message += ": ";
    message += err.message;
  }

  ErrorCode code = ErrorCode::PlatformError;
  if (name == "org.freedesktop.DBus.Error.UnknownObject" ||
      name == "org.freedesktop.DBus.Error.UnknownInterface" ||
      name == "org.bluez.Error.DoesNotExist") {
    code = ErrorCode::DeviceNotFound;
  } else if (name == "org.freedesktop.DBus.Error.ServiceUnknown" ||
             name == "org.freedesktop.DBus.Error.NoServer" ||
             name == "org.freedesktop.DBus.Error.FileNotFound") {
    code = ErrorCode::ServiceUnavailable;
  } else if (name == "org.freedesktop.DBus.Error.AccessDenied" ||
             name == "org.bluez.Error.NotAuthorized" ||
             name == "org.bluez.Error.NotPermitted") {
    code = ErrorCode::PermissionDenied;
  } else if (name == "org.freedesktop.DBus.Error.NoReply" ||
             name == "org.freedesktop.DBus.Error.Timeout" ||
             name == "org.freedesktop.DBus.Error.TimedOut") {
    code = ErrorCode::Timeout;
  } else if (name == "org.bluez.Error.NotReady") {
    code = ErrorCode::BluetoothOff;
  } else if (name == "org.bluez.Error.NotSupported") {
    code = ErrorCode::NotSupported;
  }

  return Error(code, message);
}

/**
 * @brief RAII wrapper for DBusError
 */
class DBusErrorWrapper {
public:
  DBusErrorWrapper() { dbus_error_init(&err_); }
  ~DBusErrorWrapper() { dbus_error_free(&err_); }

  DBusErrorWrapper(const DBusErrorWrapper &) = delete;
  DBusErrorWrapper &operator=(const DBusErrorWrapper &) = delete;

  DBusError *get() { return &err_; }
  bool is_set() const { return dbus_error_is_set(&err_); }
  Error to_error() const { return dbus_error_to_bluewatch(err_); }

  const char *name() const { return err_.name; }

private:
  DBusError err_;
};

// ============================================================================
// Connections and Calls
// ============================================================================

/**
 * @brief Shared system bus connection
 */
inline Result<DBusConnectionWrapper> get_system_bus() {
  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    return error.to_error();
  }

  // Shared connections must not take the process down when the bus goes
  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn);
}

/**
 * @brief Private system bus connection, owned by the caller
 */
inline Result<DBusConnectionWrapper> open_private_system_bus() {
  DBusErrorWrapper error;
  DBusConnection *conn = dbus_bus_get_private(DBUS_BUS_SYSTEM, error.get());

  if (!conn || error.is_set()) {
    return error.to_error();
  }

  dbus_connection_set_exit_on_disconnect(conn, FALSE);
  return DBusConnectionWrapper(conn, true);
}

/**
 * @brief Send a prepared method call and wait for its reply
 * @param timeout_ms Timeout in milliseconds (-1 for the bus default)
 */
inline Result<DBusMessageWrapper> send_and_wait(DBusConnection *conn,
                                                DBusMessage *msg,
                                                int timeout_ms = -1) {
  DBusErrorWrapper error;
  DBusMessage *reply = dbus_connection_send_with_reply_and_block(
      conn, msg, timeout_ms, error.get());

  if (!reply || error.is_set()) {
    if (reply) {
      dbus_message_unref(reply);
    }
    return error.to_error();
  }

  return DBusMessageWrapper(reply);
}

/**
 * @brief Call a method without arguments and get the reply
 */
inline Result<DBusMessageWrapper>
call_method(DBusConnection *conn, const char *dest, const char *path,
            const char *iface, const char *method, int timeout_ms = -1) {
  DBusMessageWrapper msg(
      dbus_message_new_method_call(dest, path, iface, method));

  if (!msg) {
    return Error(ErrorCode::PlatformError, "Failed to create D-Bus message");
  }

  return send_and_wait(conn, msg.get(), timeout_ms);
}

// ============================================================================
// Property Dictionaries
// ============================================================================

/// Decoded variant value; integers of every width widen to int64_t
using PropertyValue =
    std::variant<bool, int64_t, std::string, std::vector<std::string>>;

using PropertyMap = std::map<std::string, PropertyValue>;

/**
 * @brief Decode the value inside a variant iterator
 * @return nullopt for types the backend does not use
 */
inline std::optional<PropertyValue> read_variant(DBusMessageIter *variant) {
  DBusMessageIter value;
  dbus_message_iter_recurse(variant, &value);

  switch (dbus_message_iter_get_arg_type(&value)) {
  case DBUS_TYPE_BOOLEAN: {
    dbus_bool_t b = FALSE;
    dbus_message_iter_get_basic(&value, &b);
    return PropertyValue(static_cast<bool>(b));
  }
  case DBUS_TYPE_BYTE: {
    uint8_t n = 0;
    dbus_message_iter_get_basic(&value, &n);
    return PropertyValue(static_cast<int64_t>(n));
  }
  case DBUS_TYPE_INT16: {
    dbus_int16_t n = 0;
    dbus_message_iter_get_basic(&value, &n);
    return PropertyValue(static_cast<int64_t>(n));
  }
  case DBUS_TYPE_UINT16: {
    dbus_uint16_t n = 0;
    dbus_message_iter_get_basic(&value, &n);
    return PropertyValue(static_cast<int64_t>(n));
  }
  case DBUS_TYPE_INT32: {
    dbus_int32_t n = 0;
    dbus_message_iter_get_basic(&value, &n);
    return PropertyValue(static_cast<int64_t>(n));
  }
  case DBUS_TYPE_UINT32: {
    dbus_uint32_t n = 0;
    dbus_message_iter_get_basic(&value, &n);
    return PropertyValue(static_cast<int64_t>(n));
  }
  case DBUS_TYPE_STRING:
  case DBUS_TYPE_OBJECT_PATH: {
    const char *s = nullptr;
    dbus_message_iter_get_basic(&value, &s);
    return PropertyValue(std::string(s ? s : ""));
  }
  case DBUS_TYPE_ARRAY: {
    if (dbus_message_iter_get_element_type(&value) != DBUS_TYPE_STRING) {
      return std::nullopt;
    }
    std::vector<std::string> strings;
    DBusMessageIter element;
    dbus_message_iter_recurse(&value, &element);
    while (dbus_message_iter_get_arg_type(&element) == DBUS_TYPE_STRING) {
      const char *s = nullptr;
      dbus_message_iter_get_basic(&element, &s);
      strings.emplace_back(s ? s : "");
      dbus_message_iter_next(&element);
    }
    return PropertyValue(std::move(strings));
  }
  default:
    return std::nullopt;
  }
}

/**
 * @brief Decode an a{sv} dictionary
 * @param array Iterator positioned on the dictionary array
 */
inline PropertyMap read_property_dict(DBusMessageIter *array) {
  PropertyMap properties;
  if (dbus_message_iter_get_arg_type(array) != DBUS_TYPE_ARRAY) {
    return properties;
  }

  DBusMessageIter dict;
  dbus_message_iter_recurse(array, &dict);

  while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
    DBusMessageIter entry;
    dbus_message_iter_recurse(&dict, &entry);

    const char *key = nullptr;
    if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_STRING) {
      dbus_message_iter_get_basic(&entry, &key);
    }
    dbus_message_iter_next(&entry);

    if (key && dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_VARIANT) {
      auto value = read_variant(&entry);
      if (value) {
        properties.emplace(key, std::move(*value));
      }
    }

    dbus_message_iter_next(&dict);
  }

  return properties;
}

template <typename T>
std::optional<T> get_property(const PropertyMap &properties,
                              const std::string &key) {
  auto it = properties.find(key);
  if (it == properties.end()) {
    return std::nullopt;
  }
  if (const T *value = std::get_if<T>(&it->second)) {
    return *value;
  }
  return std::nullopt;
}

/**
 * @brief Append one {sv} entry holding a basic value
 */
inline void append_dict_entry(DBusMessageIter *dict, const char *key, int type,
                              const void *value) {
  DBusMessageIter entry, variant;
  char signature[2] = {static_cast<char>(type), '\0'};

  dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr,
                                   &entry);
  dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &key);
  dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, signature,
                                   &variant);
  dbus_message_iter_append_basic(&variant, type, value);
  dbus_message_iter_close_container(&entry, &variant);
  dbus_message_iter_close_container(dict, &entry);
}

} // namespace platform
} // namespace bluewatch

#endif // BLUEWATCH_PLATFORM_LINUX_DBUS_HELPERS_H
