/**
 * @file roster.cpp
 * @brief Roster store implementation
 */

#include "bluewatch/roster.h"

namespace bluewatch {

bool RosterStore::upsert(const BluetoothAddress &address,
                         DeviceRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(address);
  if (it == devices_.end()) {
    devices_.emplace(address, std::move(record));
    return true;
  }

  it->second = std::move(record);
  return false;
}

std::vector<DeviceRecord>
RosterStore::snapshot(TimePoint now, std::chrono::seconds timeout,
                      std::vector<DeviceRecord> *evicted) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto removed = sweep_locked(now, timeout);
  if (evicted) {
    evicted->insert(evicted->end(), removed.begin(), removed.end());
  }

  std::vector<DeviceRecord> result;
  result.reserve(devices_.size());
  for (const auto &[address, record] : devices_) {
    result.push_back(record);
  }
  return result;
}

std::vector<DeviceRecord>
RosterStore::sweep_timeouts(TimePoint now, std::chrono::seconds timeout) {
  std::lock_guard<std::mutex> lock(mutex_);
  return sweep_locked(now, timeout);
}

RosterUpdate RosterStore::update(const BluetoothAddress &address,
                                 TimePoint now, std::chrono::seconds timeout,
                                 const RecordBuilder &build) {
  std::lock_guard<std::mutex> lock(mutex_);

  // Stale entries must not count as "already known"
  auto evicted = sweep_locked(now, timeout);

  auto it = devices_.find(address);
  const DeviceRecord *existing = it != devices_.end() ? &it->second : nullptr;

  DeviceRecord record = build(existing);

  if (existing) {
    RosterUpdate result{record, *existing, false, std::move(evicted)};
    it->second = std::move(record);
    return result;
  }

  devices_.emplace(address, record);
  return RosterUpdate{std::move(record), std::nullopt, true,
                      std::move(evicted)};
}

void RosterStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_.clear();
}

std::optional<DeviceRecord>
RosterStore::find(const BluetoothAddress &address) const {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = devices_.find(address);
  if (it == devices_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t RosterStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

std::vector<DeviceRecord>
RosterStore::sweep_locked(TimePoint now, std::chrono::seconds timeout) {
  const TimePoint threshold = now - timeout;

  std::vector<DeviceRecord> evicted;
  for (auto it = devices_.begin(); it != devices_.end();) {
    if (it->second.broadcast_time() < threshold) {
      evicted.push_back(std::move(it->second));
      it = devices_.erase(it);
    } else {
      ++it;
    }
  }
  return evicted;
}

} // namespace bluewatch
