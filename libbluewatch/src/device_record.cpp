/**
 * @file device_record.cpp
 * @brief Device record formatting
 */

#include "bluewatch/device_record.h"
#include <sstream>

namespace bluewatch {

DeviceRecord::DeviceRecord(BluetoothAddress address, std::string name,
                           TimePoint broadcast_time, int16_t rssi_dbm,
                           bool connected, bool can_pair, bool paired,
                           std::string device_id,
                           std::vector<GattService> services)
    : address_(address), name_(std::move(name)),
      broadcast_time_(broadcast_time), rssi_dbm_(rssi_dbm),
      connected_(connected), can_pair_(can_pair), paired_(paired),
      device_id_(std::move(device_id)), services_(std::move(services)) {}

std::string DeviceRecord::to_string() const {
  std::ostringstream oss;
  oss << (name_.empty() ? "[No Name]" : name_) << " ["
      << address_.to_string() << "] (" << rssi_dbm_ << ")";
  return oss.str();
}

bool DeviceRecord::operator==(const DeviceRecord &other) const {
  return address_ == other.address_ && name_ == other.name_ &&
         broadcast_time_ == other.broadcast_time_ &&
         rssi_dbm_ == other.rssi_dbm_ && connected_ == other.connected_ &&
         can_pair_ == other.can_pair_ && paired_ == other.paired_ &&
         device_id_ == other.device_id_ && services_ == other.services_;
}

} // namespace bluewatch
