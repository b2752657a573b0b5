/**
 * @file bluewatch.cpp
 * @brief Library-wide information
 */

#include "bluewatch/bluewatch.h"

namespace bluewatch {

VersionInfo get_version() {
  VersionInfo info;
#ifdef BLUEWATCH_HAS_BLUETOOTH
  info.has_bluetooth = true;
#endif
  return info;
}

} // namespace bluewatch
