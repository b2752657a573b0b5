/**
 * @file roster.h
 * @brief Live table of discovered devices with heartbeat eviction
 *
 * The roster maps each hardware address to the latest DeviceRecord seen
 * for it. Every operation holds the roster's single mutex for its full
 * duration, so callers only ever observe whole operations.
 *
 * A record times out when its broadcast time is strictly older than
 * `now - timeout`.
 */

#ifndef BLUEWATCH_ROSTER_H
#define BLUEWATCH_ROSTER_H

#include "device_record.h"
#include "platform.h"
#include "types.h"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace bluewatch {

/**
 * @brief Outcome of RosterStore::update()
 */
struct RosterUpdate {
  DeviceRecord record;                   // Record now stored
  std::optional<DeviceRecord> previous;  // Record it replaced, if any
  bool is_new = false;                   // Address was absent
  std::vector<DeviceRecord> evicted;     // Timed out by the leading sweep
};

/**
 * @brief Concurrency-guarded address -> DeviceRecord map
 *
 * @code
 *   RosterStore roster;
 *   roster.upsert(record.address(), record);
 *
 *   std::vector<DeviceRecord> gone;
 *   auto devices = roster.snapshot(Clock::now(), std::chrono::seconds(30),
 *                                  &gone);
 * @endcode
 */
class BLUEWATCH_API RosterStore {
public:
  /// Builds the replacement record from the existing one (null if absent)
  using RecordBuilder = std::function<DeviceRecord(const DeviceRecord *)>;

  RosterStore() = default;

  // Non-copyable
  RosterStore(const RosterStore &) = delete;
  RosterStore &operator=(const RosterStore &) = delete;

  /**
   * @brief Insert or replace the record for an address
   * @return true if the address was not present before
   */
  bool upsert(const BluetoothAddress &address, DeviceRecord record);

  /**
   * @brief Sweep, then copy every record in address order
   * @param evicted Receives the records removed by the sweep (optional)
   */
  std::vector<DeviceRecord> snapshot(TimePoint now,
                                     std::chrono::seconds timeout,
                                     std::vector<DeviceRecord> *evicted =
                                         nullptr);

  /**
   * @brief Remove every record older than now - timeout
   * @return The removed records, for the caller to announce
   */
  std::vector<DeviceRecord> sweep_timeouts(TimePoint now,
                                           std::chrono::seconds timeout);

  /**
   * @brief Atomic sweep + lookup + build + upsert
   *
   * The builder runs under the roster lock; it must not call back into
   * the roster.
   */
  RosterUpdate update(const BluetoothAddress &address, TimePoint now,
                      std::chrono::seconds timeout,
                      const RecordBuilder &build);

  /// Remove everything without reporting evictions
  void clear();

  std::optional<DeviceRecord> find(const BluetoothAddress &address) const;
  size_t size() const;

private:
  std::vector<DeviceRecord> sweep_locked(TimePoint now,
                                         std::chrono::seconds timeout);

  mutable std::mutex mutex_;
  std::map<BluetoothAddress, DeviceRecord> devices_;
};

} // namespace bluewatch

#endif // BLUEWATCH_ROSTER_H
