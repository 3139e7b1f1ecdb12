/**
 * @file options.hpp
 * @brief Router and match cache configuration
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace waypoint {

/**
 * @brief Match cache sizing and adaptive resize policy
 */
struct CacheOptions {
  bool enabled = true;
  size_t initialCapacity = 100;
  size_t minCapacity = 50;
  size_t maxCapacity = 500;
  size_t adjustInterval = 1000;  ///< Lookups between policy checks; 0 disables
  double lowHitRate = 0.5;       ///< Grow below this window hit rate
  double highHitRate = 0.9;      ///< Shrink above this window hit rate
  size_t growStep = 20;
  size_t shrinkStep = 20;

  CacheOptions& withEnabled(bool value) {
    enabled = value;
    return *this;
  }

  CacheOptions& withCapacity(size_t initial, size_t min, size_t max) {
    initialCapacity = initial;
    minCapacity = min;
    maxCapacity = max;
    return *this;
  }

  CacheOptions& withAdjustInterval(size_t lookups) {
    adjustInterval = lookups;
    return *this;
  }

  /**
   * @throws InvalidConfigError on inconsistent bounds or rates
   */
  void validate() const;
};

/**
 * @brief Top level router configuration
 */
struct RouterOptions {
  CacheOptions cache;
  uint32_t maxRedirects = 10;
  size_t hotspotLimit = 500;
  std::chrono::milliseconds hotspotTtl{5 * 60 * 1000};
  std::string logLevel = "info";

  RouterOptions& withCache(CacheOptions options) {
    cache = options;
    return *this;
  }

  RouterOptions& withMaxRedirects(uint32_t hops) {
    maxRedirects = hops;
    return *this;
  }

  RouterOptions& withLogLevel(std::string level) {
    logLevel = std::move(level);
    return *this;
  }

  /**
   * @throws InvalidConfigError
   */
  void validate() const;
};

}  // namespace waypoint
