/**
 * @file signal.h
 * @brief Multi-observer notification channel
 *
 * Each channel keeps an ordered list of observers that can be added and
 * removed independently. emit() copies the list under the lock and then
 * invokes the copy without it, so observers may subscribe, unsubscribe or
 * call back into the emitter while a notification is running. An observer
 * removed during an emit may still receive that one emission.
 *
 * An observer that throws is logged and skipped; the others still run.
 */

#ifndef BLUEWATCH_SIGNAL_H
#define BLUEWATCH_SIGNAL_H

#include "platform.h"
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace bluewatch {

/// Handle returned by Signal::subscribe()
using SubscriptionId = uint64_t;

namespace detail {

/// Log an observer failure (keeps spdlog out of public headers)
BLUEWATCH_API void report_observer_failure(const char *channel,
                                           const char *what);

} // namespace detail

template <typename... Args> class Signal {
public:
  using Handler = std::function<void(const Args &...)>;

  explicit Signal(const char *name) : name_(name) {}

  // Non-copyable
  Signal(const Signal &) = delete;
  Signal &operator=(const Signal &) = delete;

  /// Add an observer; null handlers are ignored and yield id 0
  SubscriptionId subscribe(Handler handler) {
    if (!handler) {
      return 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    observers_.emplace(id, std::move(handler));
    return id;
  }

  /// @return false if the id was not subscribed
  bool unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.erase(id) > 0;
  }

  size_t observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.clear();
  }

  void emit(const Args &...args) const {
    std::vector<Handler> handlers;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      handlers.reserve(observers_.size());
      for (const auto &entry : observers_) {
        handlers.push_back(entry.second);
      }
    }

    for (const auto &handler : handlers) {
      try {
        handler(args...);
      } catch (const std::exception &e) {
        detail::report_observer_failure(name_, e.what());
      } catch (...) {
        detail::report_observer_failure(name_, "non-standard exception");
      }
    }
  }

  const char *name() const { return name_; }

private:
  const char *name_;
  mutable std::mutex mutex_;
  std::map<SubscriptionId, Handler> observers_; // Ordered by subscription
  SubscriptionId next_id_ = 1;
};

} // namespace bluewatch

#endif // BLUEWATCH_SIGNAL_H
