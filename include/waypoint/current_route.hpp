/**
 * @file current_route.hpp
 * @brief Observable cell holding the committed location
 */

#pragma once

#include <exception>
#include <functional>
#include <utility>

#include "guard.hpp"
#include "location.hpp"
#include "logging.hpp"

namespace waypoint {

/// Receives the new and previous location after each commit
using RouteListener =
    std::function<void(const ResolvedLocation& to, const ResolvedLocation& from)>;

class CurrentRoute {
 public:
  CurrentRoute() : value_(startLocation()) {}

  const ResolvedLocation& get() const noexcept { return value_; }

  /**
   * @brief Replace the value and notify listeners
   *
   * A throwing listener is logged and does not stop the others.
   */
  void set(ResolvedLocation location) {
    ResolvedLocation previous = std::exchange(value_, std::move(location));
    for (const auto& listener : listeners_.snapshot()) {
      try {
        listener(value_, previous);
      } catch (const std::exception& e) {
        WPT_LOG_WARN("Route change listener failed: {}", e.what());
      } catch (...) {
        WPT_LOG_WARN("Route change listener threw a non-standard exception");
      }
    }
  }

  Unregister subscribe(RouteListener listener) {
    return listeners_.add(std::move(listener));
  }

  size_t listenerCount() const noexcept { return listeners_.size(); }

 private:
  ResolvedLocation value_;
  CallbackList<RouteListener> listeners_;
};

}  // namespace waypoint
