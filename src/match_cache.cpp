#include "waypoint/match_cache.hpp"

#include <algorithm>

#include "waypoint/logging.hpp"

namespace waypoint {

MatchCache::MatchCache(const CacheOptions& options)
    : options_(options),
      capacity_(std::clamp(options.initialCapacity, options.minCapacity,
                           std::max(options.minCapacity, options.maxCapacity))),
      enabled_(options.enabled) {
  index_.reserve(capacity_);
}

std::optional<MatchResultPtr> MatchCache::get(const std::string& key,
                                              uint64_t routesVersion) {
  if (!enabled_) {
    return std::nullopt;
  }

  auto it = index_.find(key);
  if (it == index_.end()) {
    recordLookup(false);
    return std::nullopt;
  }

  auto entry = it->second;
  if (entry->routesVersion != routesVersion) {
    erase(entry);
    ++invalidations_;
    recordLookup(false);
    return std::nullopt;
  }

  entries_.splice(entries_.begin(), entries_, entry);
  entry->lastAccessGeneration = ++accessGeneration_;
  MatchResultPtr value = entry->value;
  recordLookup(true);
  return value;
}

void MatchCache::set(const std::string& key, MatchResultPtr value,
                     uint64_t routesVersion) {
  if (!enabled_) {
    return;
  }

  auto it = index_.find(key);
  if (it != index_.end()) {
    auto entry = it->second;
    entry->value = std::move(value);
    entry->routesVersion = routesVersion;
    entry->lastAccessGeneration = ++accessGeneration_;
    entries_.splice(entries_.begin(), entries_, entry);
    return;
  }

  entries_.push_front(
      CacheEntry{key, std::move(value), ++accessGeneration_, routesVersion});
  index_[key] = entries_.begin();
  evictOverflow();
}

bool MatchCache::invalidate(const std::string& key) {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return false;
  }
  erase(it->second);
  ++invalidations_;
  return true;
}

void MatchCache::clear() noexcept {
  entries_.clear();
  index_.clear();
}

size_t MatchCache::resize(size_t capacity) {
  size_t clamped = std::clamp(capacity, options_.minCapacity,
                              std::max(options_.minCapacity, options_.maxCapacity));
  if (clamped != capacity_) {
    WPT_LOG_DEBUG("Match cache capacity {} -> {}", capacity_, clamped);
  }
  capacity_ = clamped;
  evictOverflow();
  return capacity_;
}

void MatchCache::setEnabled(bool enabled) {
  enabled_ = enabled;
  if (!enabled_) {
    clear();
  }
}

CacheStats MatchCache::stats() const {
  CacheStats stats;
  stats.hits = hits_;
  stats.misses = misses_;
  stats.evictions = evictions_;
  stats.invalidations = invalidations_;
  stats.adjustments = adjustments_;
  stats.size = entries_.size();
  stats.capacity = capacity_;
  stats.enabled = enabled_;
  return stats;
}

void MatchCache::erase(typename EntryList::iterator it) {
  index_.erase(it->key);
  entries_.erase(it);
}

void MatchCache::evictOverflow() {
  while (entries_.size() > capacity_) {
    auto last = std::prev(entries_.end());
    index_.erase(last->key);
    entries_.pop_back();
    ++evictions_;
  }
}

void MatchCache::recordLookup(bool hit) {
  if (hit) {
    ++hits_;
    ++windowHits_;
  } else {
    ++misses_;
  }

  if (options_.adjustInterval == 0 || ++windowLookups_ < options_.adjustInterval) {
    return;
  }

  double rate = static_cast<double>(windowHits_) / static_cast<double>(windowLookups_);
  windowHits_ = 0;
  windowLookups_ = 0;

  size_t target = capacity_;
  if (rate < options_.lowHitRate) {
    target = capacity_ + options_.growStep;
  } else if (rate > options_.highHitRate) {
    target = capacity_ > options_.shrinkStep ? capacity_ - options_.shrinkStep : 0;
  }

  size_t before = capacity_;
  if (resize(target) != before) {
    ++adjustments_;
  }
}

}  // namespace waypoint
