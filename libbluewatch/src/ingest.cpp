/**
 * @file ingest.cpp
 * @brief Advertisement ingestion implementation
 */

#include "bluewatch/ingest.h"
#include <algorithm>

namespace bluewatch {

namespace {

/// Name the advertisement reports, falling back to the resolved name
const std::string &incoming_name(const Advertisement &advertisement,
                                 const std::optional<DeviceDetails> &details) {
  if (advertisement.local_name.empty() && details &&
      !details->display_name.empty()) {
    return details->display_name;
  }
  return advertisement.local_name;
}

} // namespace

DeviceRecord merge_advertisement(const Advertisement &advertisement,
                                 const DeviceRecord *existing,
                                 const std::optional<DeviceDetails> &details,
                                 const GattServiceCatalog &catalog) {
  const std::string &reported = incoming_name(advertisement, details);

  // Don't override what could be an actual name already
  std::string name = reported;
  if (name.empty() && existing) {
    name = existing->name();
  }

  // Out-of-order delivery must not move a device back in time
  TimePoint broadcast_time = advertisement.timestamp;
  if (existing) {
    broadcast_time = std::max(broadcast_time, existing->broadcast_time());
  }

  std::vector<GattService> services =
      catalog.resolve_all(advertisement.service_uuids);
  if (services.empty() && existing) {
    services = existing->services();
  }

  bool connected = false;
  bool can_pair = false;
  bool paired = false;
  std::string device_id;
  if (details) {
    connected = details->connected;
    can_pair = details->can_pair;
    paired = details->paired;
    device_id = details->device_id;
  } else if (existing) {
    connected = existing->connected();
    can_pair = existing->can_pair();
    paired = existing->paired();
    device_id = existing->device_id();
  }

  return DeviceRecord(advertisement.address, std::move(name), broadcast_time,
                      advertisement.rssi_dbm, connected, can_pair, paired,
                      std::move(device_id), std::move(services));
}

IngestResult ingest_advertisement(RosterStore &roster,
                                  const Advertisement &advertisement,
                                  const std::optional<DeviceDetails> &details,
                                  const GattServiceCatalog &catalog,
                                  TimePoint now,
                                  std::chrono::seconds timeout) {
  auto update = roster.update(
      advertisement.address, now, timeout,
      [&](const DeviceRecord *existing) {
        return merge_advertisement(advertisement, existing, details, catalog);
      });

  const std::string &reported = incoming_name(advertisement, details);

  // Filling in a missing name is not a change
  bool name_changed = !update.is_new && !reported.empty() &&
                      update.previous->has_name() &&
                      update.previous->name() != reported;

  return IngestResult{std::move(update.record), update.is_new, name_changed,
                      std::move(update.evicted)};
}

} // namespace bluewatch
