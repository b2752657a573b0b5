/**
 * @file radio.cpp
 * @brief Radio factory for builds without a platform backend
 */

#include "bluewatch/radio.h"

#ifndef BLUEWATCH_BLUETOOTH_BLUEZ

namespace bluewatch {

Result<std::unique_ptr<AdvertisementRadio>>
create_default_radio(const std::string &adapter) {
  BLUEWATCH_UNUSED(adapter);
  return Error(ErrorCode::BluetoothNotSupported,
               "Built without a Bluetooth backend",
               "rebuild with libdbus-1 development files for BlueZ support");
}

} // namespace bluewatch

#endif // BLUEWATCH_BLUETOOTH_BLUEZ
