/**
 * @file log.cpp
 * @brief Logging helpers
 */

#include "bluewatch/log.h"
#include "bluewatch/signal.h"
#include <optional>
#include <spdlog/spdlog.h>

namespace bluewatch {

namespace {

std::optional<spdlog::level::level_enum> to_spdlog_level(
    const std::string &level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "critical")
    return spdlog::level::critical;
  if (level == "off")
    return spdlog::level::off;
  return std::nullopt;
}

} // namespace

bool is_valid_log_level(const std::string &level) {
  return to_spdlog_level(level).has_value();
}

Result<void> set_log_level(const std::string &level) {
  auto parsed = to_spdlog_level(level);
  if (!parsed) {
    return Error(ErrorCode::InvalidArgument, "Unknown log level", level);
  }
  spdlog::set_level(*parsed);
  return Result<void>::ok();
}

namespace detail {

void report_observer_failure(const char *channel, const char *what) {
  spdlog::warn("Observer on '{}' threw: {}", channel, what);
}

} // namespace detail

} // namespace bluewatch
