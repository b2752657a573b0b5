/**
 * @file device_record.h
 * @brief Immutable snapshot of one observed BLE device
 */

#ifndef BLUEWATCH_DEVICE_RECORD_H
#define BLUEWATCH_DEVICE_RECORD_H

#include "gatt.h"
#include "platform.h"
#include "types.h"
#include <string>
#include <vector>

namespace bluewatch {

/**
 * @brief What we knew about a device at its last broadcast
 *
 * Records are never modified; the roster replaces them wholesale when a
 * newer advertisement arrives.
 */
class BLUEWATCH_API DeviceRecord {
public:
  DeviceRecord(BluetoothAddress address, std::string name,
               TimePoint broadcast_time, int16_t rssi_dbm,
               bool connected = false, bool can_pair = false,
               bool paired = false, std::string device_id = {},
               std::vector<GattService> services = {});

  /// Hardware address (roster key)
  const BluetoothAddress &address() const { return address_; }

  /// Device name, empty if never advertised
  const std::string &name() const { return name_; }

  /// Time of the advertisement this record reflects
  TimePoint broadcast_time() const { return broadcast_time_; }

  /// Signal strength in dBm
  int16_t rssi_dbm() const { return rssi_dbm_; }

  /// Are we connected to this device
  bool connected() const { return connected_; }

  /// Does this device support pairing
  bool can_pair() const { return can_pair_; }

  /// Are we paired to this device
  bool paired() const { return paired_; }

  /// Platform device id, empty when never resolved
  const std::string &device_id() const { return device_id_; }

  /// Services listed in the device's advertisements
  const std::vector<GattService> &services() const { return services_; }

  bool has_name() const { return !name_.empty(); }

  /// "<name or [No Name]> [AA:BB:CC:DD:EE:FF] (-60)"
  std::string to_string() const;

  bool operator==(const DeviceRecord &other) const;
  bool operator!=(const DeviceRecord &other) const { return !(*this == other); }

private:
  BluetoothAddress address_;
  std::string name_;
  TimePoint broadcast_time_;
  int16_t rssi_dbm_;
  bool connected_;
  bool can_pair_;
  bool paired_;
  std::string device_id_;
  std::vector<GattService> services_;
};

} // namespace bluewatch

#endif // BLUEWATCH_DEVICE_RECORD_H
