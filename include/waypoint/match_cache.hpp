/**
 * @file match_cache.hpp
 * @brief Adaptive LRU cache of normalized path to match result
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "location.hpp"
#include "options.hpp"
#include "route_trie.hpp"

namespace waypoint {

/**
 * @brief Result of matching a concrete path
 */
struct MatchResult {
  RecordPtr record;          ///< Leaf record
  Params params;             ///< Extracted parameters
  RecordChain matchedChain;  ///< Root to leaf
  Specificity score;         ///< Specificity of the winning pattern
};

using MatchResultPtr = std::shared_ptr<const MatchResult>;

/**
 * @brief Counters reported by MatchCache::stats()
 */
struct CacheStats {
  uint64_t hits = 0;
  uint64_t misses = 0;
  uint64_t evictions = 0;
  uint64_t invalidations = 0;
  uint64_t adjustments = 0;
  size_t size = 0;
  size_t capacity = 0;
  bool enabled = true;

  double hitRate() const noexcept {
    auto lookups = hits + misses;
    return lookups == 0 ? 0.0 : static_cast<double>(hits) / lookups;
  }
};

/**
 * @brief LRU cache with an O(1) adaptive capacity policy
 *
 * A stored nullptr is a cached "no match". Entries are stamped with the
 * routes version current when they were computed; a lookup with a newer
 * version treats the entry as stale and drops it.
 */
class MatchCache {
 public:
  explicit MatchCache(const CacheOptions& options = CacheOptions{});

  /**
   * @brief Look up a key
   * @return The cached value (possibly nullptr), or nullopt on a miss
   */
  std::optional<MatchResultPtr> get(const std::string& key, uint64_t routesVersion);

  void set(const std::string& key, MatchResultPtr value, uint64_t routesVersion);

  /**
   * @return True if an entry was removed
   */
  bool invalidate(const std::string& key);

  void clear() noexcept;

  /**
   * @brief Change capacity, clamped into [min, max]; evicts from the tail
   * @return The capacity actually applied
   */
  size_t resize(size_t capacity);

  /**
   * @brief Disabling also drops every entry
   */
  void setEnabled(bool enabled);

  bool enabled() const noexcept { return enabled_; }
  bool contains(const std::string& key) const { return index_.count(key) > 0; }
  size_t size() const noexcept { return entries_.size(); }
  size_t capacity() const noexcept { return capacity_; }

  CacheStats stats() const;

 private:
  struct CacheEntry {
    std::string key;
    MatchResultPtr value;
    uint64_t lastAccessGeneration = 0;
    uint64_t routesVersion = 0;
  };

  using EntryList = std::list<CacheEntry>;

  void erase(typename EntryList::iterator it);
  void evictOverflow();
  void recordLookup(bool hit);

  CacheOptions options_;
  size_t capacity_;
  bool enabled_;

  EntryList entries_;  // Front is most recently used
  std::unordered_map<std::string, EntryList::iterator> index_;
  uint64_t accessGeneration_ = 0;

  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t evictions_ = 0;
  uint64_t invalidations_ = 0;
  uint64_t adjustments_ = 0;

  uint64_t windowLookups_ = 0;
  uint64_t windowHits_ = 0;
};

}  // namespace waypoint
