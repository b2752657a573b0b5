/**
 * @file ingest.h
 * @brief Turns one received advertisement into a roster mutation
 *
 * Ingestion decides, per advertisement, whether the device is new and
 * whether its name changed, then stores the merged record. The whole
 * decision runs inside a single RosterStore::update() so two events for
 * the same address never interleave.
 *
 * Name rules:
 *   - a non-empty advertised name always wins
 *   - an empty advertised name keeps the known name
 *   - going from no name to a name is a fill, not a change
 */

#ifndef BLUEWATCH_INGEST_H
#define BLUEWATCH_INGEST_H

#include "device_record.h"
#include "gatt.h"
#include "platform.h"
#include "roster.h"
#include "types.h"
#include <chrono>
#include <optional>
#include <vector>

namespace bluewatch {

/**
 * @brief What an advertisement did to the roster
 */
struct IngestResult {
  DeviceRecord record;                 // Record stored for the device
  bool is_new = false;                 // First sighting
  bool name_changed = false;           // Known name replaced by another one
  std::vector<DeviceRecord> timed_out; // Evicted by the leading sweep
};

/**
 * @brief Merge an advertisement with the existing record (pure)
 * @param existing Current record for the address, or null
 * @param details Resolved device details, if resolution ran
 */
BLUEWATCH_API DeviceRecord merge_advertisement(
    const Advertisement &advertisement, const DeviceRecord *existing,
    const std::optional<DeviceDetails> &details,
    const GattServiceCatalog &catalog);

/**
 * @brief Apply one advertisement to the roster
 */
BLUEWATCH_API IngestResult ingest_advertisement(
    RosterStore &roster, const Advertisement &advertisement,
    const std::optional<DeviceDetails> &details,
    const GattServiceCatalog &catalog, TimePoint now,
    std::chrono::seconds timeout);

} // namespace bluewatch

#endif // BLUEWATCH_INGEST_H
