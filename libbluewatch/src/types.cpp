/**
 * @file types.cpp
 * @brief Core type implementations
 */

#include "bluewatch/types.h"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace bluewatch {

// ============================================================================
// BluetoothAddress
// ============================================================================

std::string BluetoothAddress::to_string() const {
  std::ostringstream oss;
  oss << std::hex << std::uppercase << std::setfill('0');
  for (int shift = 40; shift >= 0; shift -= 8) {
    oss << std::setw(2) << static_cast<int>((value >> shift) & 0xFF);
    if (shift > 0) {
      oss << ':';
    }
  }
  return oss.str();
}

std::optional<BluetoothAddress>
BluetoothAddress::from_string(const std::string &text) {
  // 6 octets, 2 hex digits each, 5 separators
  if (text.length() != 17) {
    return std::nullopt;
  }

  uint64_t result = 0;
  for (size_t i = 0; i < 6; ++i) {
    size_t pos = i * 3;
    if (i > 0 && text[pos - 1] != ':') {
      return std::nullopt;
    }

    unsigned char hi = static_cast<unsigned char>(text[pos]);
    unsigned char lo = static_cast<unsigned char>(text[pos + 1]);
    if (!std::isxdigit(hi) || !std::isxdigit(lo)) {
      return std::nullopt;
    }

    std::string octet = text.substr(pos, 2);
    result = (result << 8) | std::stoul(octet, nullptr, 16);
  }

  return BluetoothAddress(result);
}

// ============================================================================
// Enum Names
// ============================================================================

const char *scan_mode_name(ScanMode mode) {
  switch (mode) {
  case ScanMode::Passive:
    return "Passive";
  case ScanMode::Active:
    return "Active";
  default:
    return "Unknown";
  }
}

const char *stop_reason_name(StopReason reason) {
  switch (reason) {
  case StopReason::Requested:
    return "Requested";
  case StopReason::PlatformHalted:
    return "PlatformHalted";
  default:
    return "Unknown";
  }
}

} // namespace bluewatch
