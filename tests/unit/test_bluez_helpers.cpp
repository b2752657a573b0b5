/**
 * @file test_bluez_helpers.cpp
 * @brief Unit tests for the BlueZ backend helpers (no bus required)
 */

#include "platform/linux/bluez_radio.h"

#include <bluewatch/config.h>
#include <gtest/gtest.h>

using namespace bluewatch;
using namespace bluewatch::platform;

// ============================================================================
// Object Paths
// ============================================================================

TEST(BlueZPathTest, DeviceObjectPath) {
  BluetoothAddress address(0xAABBCCDDEEFFULL);
  EXPECT_EQ(device_object_path("/org/bluez/hci0", address),
            "/org/bluez/hci0/dev_AA_BB_CC_DD_EE_FF");
}

TEST(BlueZPathTest, AddressFromObjectPath) {
  auto address =
      address_from_object_path("/org/bluez/hci1/dev_01_23_45_67_89_ab");
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(address->value, 0x0123456789ABULL);

  EXPECT_FALSE(address_from_object_path("/org/bluez/hci0").has_value());
  EXPECT_FALSE(
      address_from_object_path("/org/bluez/hci0/dev_01_23").has_value());
}

// ============================================================================
// Error Mapping
// ============================================================================

namespace {

Error map_error(const char *name, const char *message) {
  DBusErrorWrapper error;
  dbus_set_error_const(error.get(), name, message);
  return error.to_error();
}

} // namespace

TEST(BlueZErrorTest, MapsWellKnownNames) {
  EXPECT_EQ(map_error("org.freedesktop.DBus.Error.UnknownObject", "gone").code,
            ErrorCode::DeviceNotFound);
  EXPECT_EQ(map_error("org.freedesktop.DBus.Error.ServiceUnknown", "no bluez")
                .code,
            ErrorCode::ServiceUnavailable);
  EXPECT_EQ(map_error("org.freedesktop.DBus.Error.AccessDenied", "denied").code,
            ErrorCode::PermissionDenied);
  EXPECT_EQ(map_error("org.bluez.Error.NotReady", "off").code,
            ErrorCode::BluetoothOff);
}

TEST(BlueZErrorTest, UnknownNameIsPlatformError) {
  Error err = map_error("org.bluez.Error.Failed", "something broke");
  EXPECT_EQ(err.code, ErrorCode::PlatformError);
  EXPECT_EQ(err.message, "org.bluez.Error.Failed: something broke");
}

// ============================================================================
// Device Resolution
// ============================================================================

TEST(BlueZRadioTest, ResolveRejectsTimeoutsDBusCannotTake) {
  BlueZRadio radio("hci0");
  BluetoothAddress address(0xAABBCCDDEEFFULL);

  auto overlong =
      radio.resolve_device(address, std::chrono::milliseconds(3000000000LL));
  ASSERT_TRUE(overlong.is_error());
  EXPECT_EQ(overlong.error().code, ErrorCode::InvalidArgument);

  auto unstarted = radio.resolve_device(address, MAX_RESOLVE_TIMEOUT);
  ASSERT_TRUE(unstarted.is_error());
  EXPECT_EQ(unstarted.error().code, ErrorCode::InvalidState);
}
