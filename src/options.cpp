#include "waypoint/options.hpp"

#include "waypoint/error.hpp"
#include "waypoint/logging.hpp"

namespace waypoint {

void CacheOptions::validate() const {
  if (minCapacity == 0) {
    throw InvalidConfigError("cache.minCapacity must be positive");
  }
  if (minCapacity > maxCapacity) {
    throw InvalidConfigError("cache.minCapacity exceeds cache.maxCapacity");
  }
  if (initialCapacity < minCapacity || initialCapacity > maxCapacity) {
    throw InvalidConfigError(
        "cache.initialCapacity must lie within [minCapacity, maxCapacity]");
  }
  if (lowHitRate < 0.0 || highHitRate > 1.0 || lowHitRate > highHitRate) {
    throw InvalidConfigError(
        "cache hit rate thresholds must satisfy 0 <= low <= high <= 1");
  }
}

void RouterOptions::validate() const {
  cache.validate();
  if (hotspotLimit == 0) {
    throw InvalidConfigError("hotspotLimit must be positive");
  }
  if (hotspotTtl.count() <= 0) {
    throw InvalidConfigError("hotspotTtl must be positive");
  }

  if (!logging::parseLogLevel(logLevel)) {
    throw InvalidConfigError("unknown logLevel '" + logLevel + "'");
  }
}

}  // namespace waypoint
