/**
 * @file gatt.cpp
 * @brief GATT service catalog implementation
 */

#include "bluewatch/gatt.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>

namespace bluewatch {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

bool all_hex(const std::string &text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; });
}

} // namespace

// ============================================================================
// UUID Helpers
// ============================================================================

std::string expand_uuid16(uint16_t assigned_number) {
  char buf[9];
  snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(assigned_number));
  return std::string(buf) + BLUETOOTH_BASE_UUID_SUFFIX;
}

std::optional<uint16_t> parse_uuid16(const std::string &uuid) {
  std::string text = to_lower(uuid);

  if (text.rfind("0x", 0) == 0) {
    text = text.substr(2);
  }

  if (text.length() == 4 && all_hex(text)) {
    return static_cast<uint16_t>(std::strtoul(text.c_str(), nullptr, 16));
  }

  // 0000XXXX-0000-1000-8000-00805f9b34fb
  if (text.length() == 36 && text.compare(0, 4, "0000") == 0 &&
      text.compare(8, std::string::npos, BLUETOOTH_BASE_UUID_SUFFIX) == 0) {
    std::string number = text.substr(4, 4);
    if (all_hex(number)) {
      return static_cast<uint16_t>(std::strtoul(number.c_str(), nullptr, 16));
    }
  }

  return std::nullopt;
}

// ============================================================================
// GattService
// ============================================================================

GattService::GattService(std::string service_name, std::string uti,
                         uint16_t number, std::string profile)
    : name(std::move(service_name)), uniform_type_identifier(std::move(uti)),
      assigned_number(number), profile_specification(std::move(profile)),
      uuid(expand_uuid16(number)) {}

GattService GattService::unknown(const std::string &service_uuid) {
  GattService service;
  auto number = parse_uuid16(service_uuid);
  if (number) {
    service.assigned_number = *number;
    service.uuid = expand_uuid16(*number);
  } else {
    service.uuid = to_lower(service_uuid);
  }
  return service;
}

bool GattService::operator==(const GattService &other) const {
  return name == other.name &&
         uniform_type_identifier == other.uniform_type_identifier &&
         assigned_number == other.assigned_number &&
         profile_specification == other.profile_specification &&
         uuid == other.uuid;
}

// ============================================================================
// GattServiceCatalog
// ============================================================================

void GattServiceCatalog::add(const GattService &service) {
  services_[service.assigned_number] = service;
}

std::optional<GattService>
GattServiceCatalog::find(uint16_t assigned_number) const {
  auto it = services_.find(assigned_number);
  if (it == services_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<GattService>
GattServiceCatalog::find_by_uuid(const std::string &uuid) const {
  auto number = parse_uuid16(uuid);
  if (!number) {
    return std::nullopt;
  }
  return find(*number);
}

GattService GattServiceCatalog::resolve(const std::string &uuid) const {
  auto known = find_by_uuid(uuid);
  return known ? *known : GattService::unknown(uuid);
}

std::vector<GattService>
GattServiceCatalog::resolve_all(const std::vector<std::string> &uuids) const {
  std::vector<GattService> result;
  result.reserve(uuids.size());
  for (const auto &uuid : uuids) {
    GattService service = resolve(uuid);
    bool seen = std::any_of(
        result.begin(), result.end(),
        [&service](const GattService &s) { return s.uuid == service.uuid; });
    if (!seen) {
      result.push_back(std::move(service));
    }
  }
  return result;
}

std::shared_ptr<const GattServiceCatalog> GattServiceCatalog::standard() {
  static const std::shared_ptr<const GattServiceCatalog> catalog = [] {
    auto table = std::make_shared<GattServiceCatalog>();
    table->add({"Generic Access", "org.bluetooth.service.generic_access",
                0x1800, "GSS"});
    table->add({"Generic Attribute", "org.bluetooth.service.generic_attribute",
                0x1801, "GSS"});
    table->add({"Immediate Alert", "org.bluetooth.service.immediate_alert",
                0x1802, "IAS"});
    table->add({"Link Loss", "org.bluetooth.service.link_loss", 0x1803,
                "LLS"});
    table->add({"Tx Power", "org.bluetooth.service.tx_power", 0x1804, "TPS"});
    table->add({"Current Time Service", "org.bluetooth.service.current_time",
                0x1805, "CTS"});
    table->add({"Health Thermometer",
                "org.bluetooth.service.health_thermometer", 0x1809, "HTS"});
    table->add({"Device Information",
                "org.bluetooth.service.device_information", 0x180A, "DIS"});
    table->add({"Heart Rate", "org.bluetooth.service.heart_rate", 0x180D,
                "HRS"});
    table->add({"Battery Service", "org.bluetooth.service.battery_service",
                0x180F, "BAS"});
    table->add({"Blood Pressure", "org.bluetooth.service.blood_pressure",
                0x1810, "BLS"});
    table->add({"Human Interface Device",
                "org.bluetooth.service.human_interface_device", 0x1812,
                "HIDS"});
    table->add({"Scan Parameters", "org.bluetooth.service.scan_parameters",
                0x1813, "ScPS"});
    table->add({"Running Speed and Cadence",
                "org.bluetooth.service.running_speed_and_cadence", 0x1814,
                "RSCS"});
    table->add({"Cycling Speed and Cadence",
                "org.bluetooth.service.cycling_speed_and_cadence", 0x1816,
                "CSCS"});
    table->add({"Cycling Power", "org.bluetooth.service.cycling_power",
                0x1818, "CPS"});
    table->add({"Location and Navigation",
                "org.bluetooth.service.location_and_navigation", 0x1819,
                "LNS"});
    table->add({"Environmental Sensing",
                "org.bluetooth.service.environmental_sensing", 0x181A, "ESS"});
    table->add({"User Data", "org.bluetooth.service.user_data", 0x181C,
                "UDS"});
    table->add({"Weight Scale", "org.bluetooth.service.weight_scale", 0x181D,
                "WSS"});
    table->add({"Fitness Machine", "org.bluetooth.service.fitness_machine",
                0x1826, "FTMS"});
    return std::shared_ptr<const GattServiceCatalog>(std::move(table));
  }();
  return catalog;
}

} // namespace bluewatch
