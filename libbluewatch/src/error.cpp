/**
 * @file error.cpp
 * @brief Error handling implementation
 */

#include "bluewatch/error.h"
#include <sstream>

namespace bluewatch {

// ============================================================================
// Error Code Names
// ============================================================================

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Success";
  case ErrorCode::Unknown:
    return "Unknown";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::InvalidState:
    return "InvalidState";
  case ErrorCode::NotInitialized:
    return "NotInitialized";
  case ErrorCode::AlreadyInitialized:
    return "AlreadyInitialized";
  case ErrorCode::NotSupported:
    return "NotSupported";
  case ErrorCode::Timeout:
    return "Timeout";
  case ErrorCode::Cancelled:
    return "Cancelled";

  case ErrorCode::BluetoothOff:
    return "BluetoothOff";
  case ErrorCode::BluetoothNotSupported:
    return "BluetoothNotSupported";
  case ErrorCode::AdapterNotFound:
    return "AdapterNotFound";
  case ErrorCode::ScanFailed:
    return "ScanFailed";
  case ErrorCode::DeviceNotFound:
    return "DeviceNotFound";
  case ErrorCode::ResolutionBacklog:
    return "ResolutionBacklog";

  case ErrorCode::PlatformError:
    return "PlatformError";
  case ErrorCode::PermissionDenied:
    return "PermissionDenied";
  case ErrorCode::ServiceUnavailable:
    return "ServiceUnavailable";
  case ErrorCode::HardwareNotAvailable:
    return "HardwareNotAvailable";

  default:
    return "UnknownError";
  }
}

// ============================================================================
// Error Code Descriptions
// ============================================================================

const char *error_code_description(ErrorCode code) {
  switch (code) {
  case ErrorCode::Success:
    return "Operation completed successfully";
  case ErrorCode::Unknown:
    return "An unknown error occurred";
  case ErrorCode::InvalidArgument:
    return "Invalid argument provided";
  case ErrorCode::InvalidState:
    return "Operation not valid in current state";
  case ErrorCode::NotInitialized:
    return "Component not initialized";
  case ErrorCode::AlreadyInitialized:
    return "Component already initialized";
  case ErrorCode::NotSupported:
    return "Operation not supported";
  case ErrorCode::Timeout:
    return "Operation timed out";
  case ErrorCode::Cancelled:
    return "Operation was cancelled";

  case ErrorCode::BluetoothOff:
    return "Bluetooth is disabled";
  case ErrorCode::BluetoothNotSupported:
    return "Bluetooth not supported on this system";
  case ErrorCode::AdapterNotFound:
    return "No Bluetooth adapter found";
  case ErrorCode::ScanFailed:
    return "BLE scanning failed";
  case ErrorCode::DeviceNotFound:
    return "Device could not be resolved";
  case ErrorCode::ResolutionBacklog:
    return "Too many device lookups in flight";

  case ErrorCode::PlatformError:
    return "Platform-specific error occurred";
  case ErrorCode::PermissionDenied:
    return "Permission denied";
  case ErrorCode::ServiceUnavailable:
    return "Required service unavailable";
  case ErrorCode::HardwareNotAvailable:
    return "Required hardware not available";

  default:
    return "Unknown error occurred";
  }
}

// ============================================================================
// Recoverability
// ============================================================================

bool is_recoverable(ErrorCode code) {
  switch (code) {
  // Non-recoverable errors
  case ErrorCode::NotSupported:
  case ErrorCode::BluetoothNotSupported:
  case ErrorCode::HardwareNotAvailable:
  case ErrorCode::AdapterNotFound:
    return false;

  default:
    return true;
  }
}

// ============================================================================
// Error::to_string
// ============================================================================

std::string Error::to_string() const {
  std::ostringstream oss;

  oss << error_code_name(code);

  if (!message.empty()) {
    oss << ": " << message;
  }

  if (!details.empty()) {
    oss << " (" << details << ")";
  }

  if (!location.empty()) {
    oss << " [" << location << "]";
  }

  return oss.str();
}

} // namespace bluewatch
