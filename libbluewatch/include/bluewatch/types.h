/**
 * @file types.h
 * @brief Core type definitions for bluewatch
 */

#ifndef BLUEWATCH_TYPES_H
#define BLUEWATCH_TYPES_H

#include "platform.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bluewatch {

// ============================================================================
// Time
// ============================================================================

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// Source of "now" for timeout decisions (replaceable in tests)
using ClockSource = std::function<TimePoint()>;

// ============================================================================
// Identifiers
// ============================================================================

/**
 * @brief 48-bit Bluetooth hardware address, the roster key
 *
 * Stored in the low 48 bits of a 64-bit integer, most significant octet
 * first when formatted.
 */
struct BluetoothAddress {
  uint64_t value = 0;

  BluetoothAddress() = default;
  explicit BluetoothAddress(uint64_t v) : value(v & 0xFFFFFFFFFFFFULL) {}

  bool operator==(const BluetoothAddress &other) const {
    return value == other.value;
  }
  bool operator!=(const BluetoothAddress &other) const {
    return value != other.value;
  }
  bool operator<(const BluetoothAddress &other) const {
    return value < other.value;
  }

  /// "AA:BB:CC:DD:EE:FF"
  std::string to_string() const;

  /// Parse "AA:BB:CC:DD:EE:FF" (case-insensitive)
  static std::optional<BluetoothAddress> from_string(const std::string &text);

  bool is_zero() const { return value == 0; }
};

// ============================================================================
// Radio Types
// ============================================================================

/// How the radio scans: passive listens only, active sends scan requests
enum class ScanMode : uint8_t { Passive = 0, Active = 1 };

/// Status reported by the platform radio
enum class RadioStatus : uint8_t { Stopped = 0, Started = 1 };

/**
 * @brief Why the watcher stopped listening
 */
enum class StopReason : uint8_t {
  /// stop_listening() was called
  Requested = 0,

  /// The radio stopped on its own (adapter off, discovery ended, bus lost)
  PlatformHalted = 1
};

BLUEWATCH_API const char *scan_mode_name(ScanMode mode);
BLUEWATCH_API const char *stop_reason_name(StopReason reason);

/**
 * @brief One received advertisement, as delivered by the radio
 */
struct Advertisement {
  BluetoothAddress address;
  std::string local_name; // Empty when the broadcast carried no name
  TimePoint timestamp;
  int16_t rssi_dbm = 0;
  std::vector<std::string> service_uuids; // Advertised service hints
};

/**
 * @brief Supplementary information from the platform device stack
 */
struct DeviceDetails {
  std::string display_name;
  bool connected = false;
  bool can_pair = false;
  bool paired = false;
  std::string device_id; // Platform id (BlueZ object path)
};

} // namespace bluewatch

#endif // BLUEWATCH_TYPES_H
