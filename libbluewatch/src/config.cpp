/**
 * @file config.cpp
 * @brief Configuration defaults, validation and environment overrides
 */

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "bluewatch/config.h"
#include "bluewatch/log.h"

namespace bluewatch {

namespace {

Result<long long> parse_integer(const char *name, const char *text) {
  errno = 0;
  char *end = nullptr;
  long long value = std::strtoll(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0') {
    return Error(ErrorCode::InvalidArgument,
                 std::string(name) + " is not an integer", text);
  }
  return value;
}

std::string lowercase(const char *text) {
  std::string result(text);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

} // namespace

// ============================================================================
// Limits
// ============================================================================

Result<void> check_heartbeat_timeout(std::chrono::seconds timeout) {
  if (timeout.count() <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Heartbeat timeout must be positive");
  }
  if (timeout > MAX_HEARTBEAT_TIMEOUT) {
    return Error(ErrorCode::InvalidArgument, "Heartbeat timeout is too long",
                 std::to_string(timeout.count()) + "s > " +
                     std::to_string(MAX_HEARTBEAT_TIMEOUT.count()) + "s");
  }
  return Result<void>::ok();
}

Result<void> check_resolve_timeout(std::chrono::milliseconds timeout) {
  if (timeout.count() <= 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Resolve timeout must be positive");
  }
  if (timeout > MAX_RESOLVE_TIMEOUT) {
    return Error(ErrorCode::InvalidArgument, "Resolve timeout is too long",
                 std::to_string(timeout.count()) + "ms > " +
                     std::to_string(MAX_RESOLVE_TIMEOUT.count()) + "ms");
  }
  return Result<void>::ok();
}

// ============================================================================
// WatcherConfig Methods
// ============================================================================

void WatcherConfig::load_defaults() {
  heartbeat_timeout = std::chrono::seconds(30);
  sweep_interval = std::chrono::milliseconds(0);

  scan_mode = ScanMode::Active;
  adapter.clear();

  resolve_device_details = true;
  resolve_timeout = std::chrono::milliseconds(2000);
  max_pending_resolutions = 16;

  services = GattServiceCatalog::standard();

  log_level = "info";
}

Result<void> WatcherConfig::validate() const {
  BLUEWATCH_TRY(check_heartbeat_timeout(heartbeat_timeout));

  if (sweep_interval.count() < 0) {
    return Error(ErrorCode::InvalidArgument,
                 "Sweep interval must not be negative");
  }

  if (resolve_device_details) {
    BLUEWATCH_TRY(check_resolve_timeout(resolve_timeout));
    if (max_pending_resolutions == 0) {
      return Error(ErrorCode::InvalidArgument,
                   "At least one pending resolution must be allowed");
    }
  }

  if (!services) {
    return Error(ErrorCode::InvalidArgument, "GATT service catalog is null");
  }

  if (!is_valid_log_level(log_level)) {
    return Error(ErrorCode::InvalidArgument, "Unknown log level", log_level);
  }

  return Result<void>::ok();
}

Result<void> WatcherConfig::apply_environment() {
  if (const char *value = std::getenv("BLUEWATCH_HEARTBEAT_TIMEOUT")) {
    auto seconds = parse_integer("BLUEWATCH_HEARTBEAT_TIMEOUT", value);
    BLUEWATCH_TRY(seconds);
    if (seconds.value() <= 0 ||
        seconds.value() > MAX_HEARTBEAT_TIMEOUT.count()) {
      return Error(ErrorCode::InvalidArgument,
                   "BLUEWATCH_HEARTBEAT_TIMEOUT is out of range", value);
    }
    heartbeat_timeout = std::chrono::seconds(seconds.value());
  }

  if (const char *value = std::getenv("BLUEWATCH_SCAN_MODE")) {
    std::string mode = lowercase(value);
    if (mode == "active") {
      scan_mode = ScanMode::Active;
    } else if (mode == "passive") {
      scan_mode = ScanMode::Passive;
    } else {
      return Error(ErrorCode::InvalidArgument,
                   "BLUEWATCH_SCAN_MODE must be active or passive", value);
    }
  }

  if (const char *value = std::getenv("BLUEWATCH_RESOLVE_DETAILS")) {
    std::string flag = lowercase(value);
    if (flag == "1" || flag == "true" || flag == "yes") {
      resolve_device_details = true;
    } else if (flag == "0" || flag == "false" || flag == "no") {
      resolve_device_details = false;
    } else {
      return Error(ErrorCode::InvalidArgument,
                   "BLUEWATCH_RESOLVE_DETAILS must be a boolean", value);
    }
  }

  if (const char *value = std::getenv("BLUEWATCH_RESOLVE_TIMEOUT_MS")) {
    auto ms = parse_integer("BLUEWATCH_RESOLVE_TIMEOUT_MS", value);
    BLUEWATCH_TRY(ms);
    if (ms.value() <= 0 || ms.value() > MAX_RESOLVE_TIMEOUT.count()) {
      return Error(ErrorCode::InvalidArgument,
                   "BLUEWATCH_RESOLVE_TIMEOUT_MS is out of range", value);
    }
    resolve_timeout = std::chrono::milliseconds(ms.value());
  }

  if (const char *value = std::getenv("BLUEWATCH_MAX_PENDING_RESOLUTIONS")) {
    auto count = parse_integer("BLUEWATCH_MAX_PENDING_RESOLUTIONS", value);
    BLUEWATCH_TRY(count);
    if (count.value() <= 0) {
      return Error(ErrorCode::InvalidArgument,
                   "BLUEWATCH_MAX_PENDING_RESOLUTIONS must be positive",
                   value);
    }
    max_pending_resolutions = static_cast<size_t>(count.value());
  }

  if (const char *value = std::getenv("BLUEWATCH_SWEEP_INTERVAL_MS")) {
    auto ms = parse_integer("BLUEWATCH_SWEEP_INTERVAL_MS", value);
    BLUEWATCH_TRY(ms);
    if (ms.value() < 0) {
      return Error(ErrorCode::InvalidArgument,
                   "BLUEWATCH_SWEEP_INTERVAL_MS must not be negative", value);
    }
    sweep_interval = std::chrono::milliseconds(ms.value());
  }

  if (const char *value = std::getenv("BLUEWATCH_ADAPTER")) {
    adapter = value;
  }

  if (const char *value = std::getenv("BLUEWATCH_LOG_LEVEL")) {
    std::string level = lowercase(value);
    if (!is_valid_log_level(level)) {
      return Error(ErrorCode::InvalidArgument, "Unknown log level", value);
    }
    log_level = level;
  }

  return Result<void>::ok();
}

} // namespace bluewatch
