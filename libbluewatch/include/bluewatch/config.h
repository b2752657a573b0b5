/**
 * @file config.h
 * @brief Watcher configuration and environment overrides
 */

#ifndef BLUEWATCH_CONFIG_H
#define BLUEWATCH_CONFIG_H

#include "error.h"
#include "gatt.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace bluewatch {

// ============================================================================
// Limits
// ============================================================================

/// Longest accepted heartbeat timeout (one week)
constexpr std::chrono::seconds MAX_HEARTBEAT_TIMEOUT{7 * 24 * 60 * 60};

/// Longest accepted single device lookup
constexpr std::chrono::milliseconds MAX_RESOLVE_TIMEOUT{60 * 1000};

/// InvalidArgument unless 0 < timeout <= MAX_HEARTBEAT_TIMEOUT
BLUEWATCH_API Result<void>
check_heartbeat_timeout(std::chrono::seconds timeout);

/// InvalidArgument unless 0 < timeout <= MAX_RESOLVE_TIMEOUT
BLUEWATCH_API Result<void>
check_resolve_timeout(std::chrono::milliseconds timeout);

/**
 * @brief Complete configuration for an AdvertisementWatcher
 */
struct WatcherConfig {
  // ========================================================================
  // Roster
  // ========================================================================

  /// Remove devices not re-advertised within this time
  std::chrono::seconds heartbeat_timeout{30};

  /// Background sweep period for prompt timeouts (0 = sweep on demand only)
  std::chrono::milliseconds sweep_interval{0};

  // ========================================================================
  // Radio
  // ========================================================================

  /// Passive listens only; active also requests scan responses
  ScanMode scan_mode = ScanMode::Active;

  /// Adapter to use ("hci0"); empty selects the first adapter
  std::string adapter;

  // ========================================================================
  // Device Resolution
  // ========================================================================

  /// Query connection/pairing details for every advertisement
  bool resolve_device_details = true;

  /// Upper bound on a single device lookup
  std::chrono::milliseconds resolve_timeout{2000};

  /// Advertisements are dropped while this many lookups are in flight
  size_t max_pending_resolutions = 16;

  // ========================================================================
  // Services
  // ========================================================================

  /// Catalog used to describe advertised services (required)
  std::shared_ptr<const GattServiceCatalog> services =
      GattServiceCatalog::standard();

  // ========================================================================
  // Logging
  // ========================================================================

  /// trace, debug, info, warn, error, critical or off
  std::string log_level = "info";

  // ========================================================================
  // Methods
  // ========================================================================

  /// Reset every field to its default
  void load_defaults();

  /// Validate configuration
  Result<void> validate() const;

  /**
   * @brief Override fields from BLUEWATCH_* environment variables
   *
   * Unset variables leave the field untouched. The first malformed value
   * aborts with InvalidArgument and leaves later fields untouched.
   */
  Result<void> apply_environment();
};

} // namespace bluewatch

#endif // BLUEWATCH_CONFIG_H
