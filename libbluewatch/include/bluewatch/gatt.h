/**
 * @file gatt.h
 * @brief GATT service descriptions and the catalog of known services
 *
 * Advertisements frequently list the services a peripheral offers as
 * 16-bit assigned numbers or full 128-bit UUIDs. The catalog maps those
 * onto human-readable descriptions; no GATT connection is ever made.
 *
 * @see https://www.bluetooth.com/specifications/assigned-numbers/
 */

#ifndef BLUEWATCH_GATT_H
#define BLUEWATCH_GATT_H

#include "platform.h"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bluewatch {

/// Bluetooth Base UUID suffix used to expand 16-bit assigned numbers
constexpr const char *BLUETOOTH_BASE_UUID_SUFFIX =
    "-0000-1000-8000-00805f9b34fb";

/**
 * @brief Expand a 16-bit assigned number onto the Bluetooth Base UUID
 * @return e.g. "0000180f-0000-1000-8000-00805f9b34fb"
 */
BLUEWATCH_API std::string expand_uuid16(uint16_t assigned_number);

/**
 * @brief Extract the 16-bit assigned number from a UUID string
 *
 * Accepts "180f", "0x180F" or a full UUID built on the Base UUID.
 */
BLUEWATCH_API std::optional<uint16_t> parse_uuid16(const std::string &uuid);

// ============================================================================
// GATT Service
// ============================================================================

/**
 * @brief Details about a specific GATT service
 */
struct GattService {
  /// Human-readable name ("Battery Service"); empty for unknown services
  std::string name;

  /// Uniform type identifier ("org.bluetooth.service.battery_service")
  std::string uniform_type_identifier;

  /// 16-bit assigned number, 0 for vendor 128-bit services
  uint16_t assigned_number = 0;

  /// Specification defining the service ("BAS")
  std::string profile_specification;

  /// Full lowercase 128-bit UUID
  std::string uuid;

  GattService() = default;
  GattService(std::string name, std::string uniform_type_identifier,
              uint16_t assigned_number, std::string profile_specification);

  /// Description for a UUID the catalog does not know
  static GattService unknown(const std::string &uuid);

  bool is_known() const { return !name.empty(); }

  bool operator==(const GattService &other) const;
  bool operator!=(const GattService &other) const { return !(*this == other); }
};

// ============================================================================
// GATT Service Catalog
// ============================================================================

/**
 * @brief Lookup table of known GATT services
 */
class BLUEWATCH_API GattServiceCatalog {
public:
  GattServiceCatalog() = default;

  /// Add or replace the entry for service.assigned_number
  void add(const GattService &service);

  std::optional<GattService> find(uint16_t assigned_number) const;
  std::optional<GattService> find_by_uuid(const std::string &uuid) const;

  /// Known entry for the UUID, or GattService::unknown(uuid)
  GattService resolve(const std::string &uuid) const;

  /// resolve() for every UUID, preserving order and dropping duplicates
  std::vector<GattService>
  resolve_all(const std::vector<std::string> &uuids) const;

  size_t size() const { return services_.size(); }

  /// Shared table of the adopted services
  static std::shared_ptr<const GattServiceCatalog> standard();

private:
  std::map<uint16_t, GattService> services_;
};

} // namespace bluewatch

#endif // BLUEWATCH_GATT_H
