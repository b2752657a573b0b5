/**
 * @file bluewatch.h
 * @brief Main bluewatch API Header
 *
 * bluewatch - Bluetooth LE advertisement watcher
 *
 * Listens for nearby BLE advertisements and keeps a live roster of the
 * devices heard recently:
 * - Device roster keyed by Bluetooth address, with heartbeat timeouts
 * - Notifications for new devices, name changes and timeouts
 * - GATT service lookup for advertised service UUIDs
 * - BlueZ backend on Linux
 *
 * Quick Start:
 * @code
 *   #include <bluewatch/bluewatch.h>
 *
 *   auto radio = bluewatch::create_default_radio();
 *   bluewatch::AdvertisementWatcher watcher;
 *   watcher.init(std::move(radio).value());
 *
 *   watcher.on_new_device_discovered([](const bluewatch::DeviceRecord &d) {
 *       std::cout << "Found: " << d.to_string() << std::endl;
 *   });
 *
 *   watcher.start_listening();
 * @endcode
 *
 * @license GPL-3.0-or-later
 */

#ifndef BLUEWATCH_BLUEWATCH_H
#define BLUEWATCH_BLUEWATCH_H

// Core headers (in dependency order)
#include "error.h"
#include "platform.h"
#include "types.h"

// Feature headers
#include "config.h"
#include "device_record.h"
#include "gatt.h"
#include "ingest.h"
#include "log.h"
#include "radio.h"
#include "roster.h"
#include "signal.h"
#include "watcher.h"

namespace bluewatch {

// ============================================================================
// Version Information
// ============================================================================

/// bluewatch major version
constexpr int VERSION_MAJOR = 0;

/// bluewatch minor version
constexpr int VERSION_MINOR = 1;

/// bluewatch patch version
constexpr int VERSION_PATCH = 0;

/// bluewatch version string
constexpr const char *VERSION_STRING = "0.1.0";

struct VersionInfo {
  int major = VERSION_MAJOR;
  int minor = VERSION_MINOR;
  int patch = VERSION_PATCH;
  const char *version_string = VERSION_STRING;
  const char *build_date = __DATE__;

  /// Whether this build carries a platform radio
  bool has_bluetooth = false;
};

BLUEWATCH_API VersionInfo get_version();

} // namespace bluewatch

#endif // BLUEWATCH_BLUEWATCH_H
