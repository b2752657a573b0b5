/**
 * @file log.h
 * @brief Logging setup
 *
 * bluewatch logs through spdlog's default logger. Applications may
 * replace that logger; these helpers only adjust its level.
 */

#ifndef BLUEWATCH_LOG_H
#define BLUEWATCH_LOG_H

#include "error.h"
#include "platform.h"
#include <string>

namespace bluewatch {

/// trace, debug, info, warn, error, critical or off
BLUEWATCH_API bool is_valid_log_level(const std::string &level);

/// Set the level of the default logger
BLUEWATCH_API Result<void> set_log_level(const std::string &level);

} // namespace bluewatch

#endif // BLUEWATCH_LOG_H
