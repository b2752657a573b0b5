/**
 * @file main.cpp
 * @brief Interactive console for the advertisement watcher
 *
 * Prints watcher events as they happen. Commands (one per line):
 *   <Enter>      print the current roster
 *   t <seconds>  change the heartbeat timeout
 *   start        start listening
 *   stop         stop listening
 *   q            quit
 */

#include <bluewatch/bluewatch.h>

#include <cstdlib>
#include <iostream>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>
#include <string>

namespace {

constexpr const char *COLOR_RESET = "\033[0m";
constexpr const char *COLOR_DARK_YELLOW = "\033[33m";
constexpr const char *COLOR_GRAY = "\033[90m";
constexpr const char *COLOR_GREEN = "\033[92m";
constexpr const char *COLOR_YELLOW = "\033[93m";
constexpr const char *COLOR_RED = "\033[91m";
constexpr const char *COLOR_WHITE = "\033[97m";

// Events arrive on the radio thread while the main thread prints the roster
std::mutex g_output_mutex;

void print_line(const char *color, const std::string &text) {
  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cout << color << text << COLOR_RESET << std::endl;
}

void print_roster(bluewatch::AdvertisementWatcher &watcher) {
  auto devices = watcher.get_discovered_devices();

  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cout << COLOR_WHITE << devices.size() << " devices ..." << std::endl;
  for (const auto &device : devices) {
    std::cout << device.to_string() << std::endl;
    for (const auto &service : device.services()) {
      std::cout << "    " << service.name << " (" << service.uuid << ")"
                << std::endl;
    }
  }
  std::cout << COLOR_RESET;
}

void print_usage(const char *program) {
  std::cout << "Usage: " << program << " [--debug]\n"
            << "\n"
            << "Commands: <Enter> roster, t <seconds> timeout, start, stop, "
               "q quit\n"
            << "\n"
            << "Environment: BLUEWATCH_HEARTBEAT_TIMEOUT, BLUEWATCH_SCAN_MODE,\n"
            << "  BLUEWATCH_RESOLVE_DETAILS, BLUEWATCH_RESOLVE_TIMEOUT_MS,\n"
            << "  BLUEWATCH_MAX_PENDING_RESOLUTIONS, BLUEWATCH_SWEEP_INTERVAL_MS,\n"
            << "  BLUEWATCH_ADAPTER, BLUEWATCH_LOG_LEVEL" << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");

  bool debug = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--debug") {
      debug = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return EXIT_SUCCESS;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      print_usage(argv[0]);
      return EXIT_FAILURE;
    }
  }

  bluewatch::WatcherConfig config;
  config.load_defaults();
  auto env = config.apply_environment();
  if (env.is_error()) {
    spdlog::error("Invalid environment: {}", env.error().to_string());
    return EXIT_FAILURE;
  }
  if (debug) {
    config.log_level = "debug";
  }

  auto radio = bluewatch::create_default_radio(config.adapter);
  if (radio.is_error()) {
    spdlog::error("No Bluetooth radio: {}", radio.error().to_string());
    return EXIT_FAILURE;
  }

  bluewatch::AdvertisementWatcher watcher;
  auto init = watcher.init(std::move(radio).value(), config);
  if (init.is_error()) {
    spdlog::error("Failed to initialize watcher: {}", init.error().to_string());
    return EXIT_FAILURE;
  }

  watcher.on_started(
      [] { print_line(COLOR_DARK_YELLOW, "Started listening"); });

  watcher.on_stopped([](const bluewatch::StopReason &reason) {
    print_line(COLOR_GRAY, std::string("Stopped listening (") +
                               bluewatch::stop_reason_name(reason) + ")");
  });

  watcher.on_new_device_discovered([](const bluewatch::DeviceRecord &device) {
    print_line(COLOR_GREEN, "New device: " + device.to_string());
  });

  watcher.on_device_name_changed([](const bluewatch::DeviceRecord &device) {
    print_line(COLOR_YELLOW, "Device name changed: " + device.to_string());
  });

  watcher.on_device_timed_out([](const bluewatch::DeviceRecord &device) {
    print_line(COLOR_RED, "Device timeout: " + device.to_string());
  });

  auto started = watcher.start_listening();
  if (started.is_error()) {
    spdlog::error("Failed to start listening: {}", started.error().to_string());
  }

  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream input(line);
    std::string command;
    input >> command;

    if (command.empty()) {
      print_roster(watcher);
    } else if (command == "q" || command == "quit") {
      break;
    } else if (command == "start") {
      auto result = watcher.start_listening();
      if (result.is_error()) {
        spdlog::error("Failed to start listening: {}",
                      result.error().to_string());
      }
    } else if (command == "stop") {
      watcher.stop_listening();
    } else if (command == "t") {
      long long seconds = 0;
      if (!(input >> seconds)) {
        spdlog::warn("Usage: t <seconds>");
        continue;
      }
      auto result = watcher.set_heartbeat_timeout(std::chrono::seconds(seconds));
      if (result.is_error()) {
        spdlog::warn("{}", result.error().to_string());
      } else {
        spdlog::info("Heartbeat timeout set to {}s", seconds);
      }
    } else {
      spdlog::warn("Unknown command: {}", command);
    }
  }

  watcher.shutdown();
  return EXIT_SUCCESS;
}
