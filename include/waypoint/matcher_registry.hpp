/**
 * @file matcher_registry.hpp
 * @brief Route table: grouped tries, record arena, name index, cache and
 * hotspot accounting
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "location.hpp"
#include "match_cache.hpp"
#include "options.hpp"
#include "path_compiler.hpp"
#include "route_record.hpp"
#include "route_trie.hpp"

namespace waypoint {

/**
 * @brief Access counter of one normalized path
 */
struct Hotspot {
  std::string path;
  uint64_t hits = 0;
  std::chrono::steady_clock::time_point lastAccess;
  std::chrono::nanoseconds avgMatchTime{0};  ///< Mean lookup time, cache hits included
};

/**
 * @brief Snapshot of registry counters
 */
struct RegistryStats {
  size_t routes = 0;
  size_t groups = 0;
  size_t trieNodes = 0;
  uint64_t routesVersion = 0;
  size_t trackedPaths = 0;
  bool preheated = false;
  CacheStats cache;
  std::vector<Hotspot> topHotspots;
};

/**
 * @brief Owner of every route record and the structures that find them
 *
 * Records live in an arena indexed by id (slot 0 is never used); parents and
 * children refer to each other by id. Groups are searched in creation order
 * and the first group with a match wins.
 */
class MatcherRegistry {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  static constexpr std::string_view DEFAULT_GROUP = "default";

  /**
   * @param options Validated on construction
   * @param clock Time source for hotspot expiry; steady_clock when empty
   * @throws InvalidConfigError
   */
  explicit MatcherRegistry(const RouterOptions& options = RouterOptions{},
                           Clock clock = {});

  /**
   * @brief Register a route definition and its children
   *
   * Every pattern in the definition tree is compiled first; a compile error
   * leaves the registry untouched. A name that is already taken replaces
   * the existing record together with its descendants.
   *
   * @param definition Route definition, children included
   * @param parent Parent record id for a nested registration
   * @param group Trie group to insert into, created on first use
   * @return Id of the top record, or the first compile error
   * @throws ParentNotFoundError if parent does not name a live record
   */
  Result<RecordId, CompileError> addRoute(const RouteDefinition& definition,
                                          std::optional<RecordId> parent = std::nullopt,
                                          std::string_view group = DEFAULT_GROUP);

  /**
   * @brief Remove a record and all its descendants
   * @return False if nothing was registered under the id or name
   */
  bool removeRoute(RecordId id);
  bool removeRoute(std::string_view name);

  /**
   * @brief Match a concrete path through the cache
   *
   * Query and hash are ignored. Records a hotspot hit for the normalized path.
   *
   * @return Match or nullptr when no route matches
   */
  MatchResultPtr match(std::string_view path);

  /**
   * @brief Match a normalized path against the tries, bypassing the cache
   */
  MatchResultPtr matchUncached(std::string_view normalizedPath) const;

  /**
   * @brief Resolve a raw location to a full location
   *
   * @return Resolved location, or MatchNotFoundError for an unknown name or
   * a path no route matches
   * @throws MissingParamError if a named location lacks a required param
   */
  Result<ResolvedLocation, MatchNotFoundError> resolve(const RawLocation& raw);

  RecordPtr matchByName(std::string_view name) const;
  RecordPtr getRecord(RecordId id) const;
  bool hasRoute(std::string_view name) const;

  /**
   * @brief Live records in registration order
   */
  std::vector<RecordPtr> getRoutes() const;

  /**
   * @brief Records from the root down to id
   */
  RecordChain chainOf(RecordId id) const;

  std::vector<RecordId> childrenOf(RecordId id) const;

  /**
   * @brief Most frequently matched paths, most hits first
   */
  std::vector<Hotspot> topHotspots(size_t count) const;

  /**
   * @brief Warm the cache
   * @param paths Paths to match; empty means the current top 20 hotspots
   * @return Number of paths matched
   */
  size_t preheat(const std::vector<std::string>& paths = {});

  RegistryStats stats() const;

  MatchCache& cache() noexcept { return cache_; }
  const MatchCache& cache() const noexcept { return cache_; }

  uint64_t routesVersion() const noexcept { return routesVersion_; }
  size_t size() const noexcept { return liveRecords_; }
  std::vector<std::string> groups() const;

  void clear();

 private:
  struct Group {
    std::string name;
    RouteTrie trie;
  };

  struct Planned {
    const RouteDefinition* definition;
    CompiledPattern pattern;
    std::optional<size_t> parentIndex;  // Index into the plan
    bool defaultChild = false;
  };

  std::optional<CompileError> plan(const RouteDefinition& definition,
                                   std::string_view parentPath,
                                   std::optional<size_t> parentIndex,
                                   std::vector<Planned>& out) const;

  RouteTrie& ensureGroup(std::string_view name);
  RouteTrie* findGroup(std::string_view name);
  MatchResultPtr buildResult(RecordId id, Params params, Specificity score) const;
  void collectDescendants(RecordId id, std::vector<RecordId>& out) const;
  void eraseRecord(RecordId id);
  void recordHotspot(const std::string& path, std::chrono::nanoseconds elapsed);
  void cleanupHotspots();

  RouterOptions options_;
  Clock clock_;

  std::vector<Group> groups_;
  std::vector<RecordPtr> arena_;
  std::unordered_map<RecordId, CompiledPattern> patterns_;
  std::unordered_map<std::string, RecordId> names_;
  std::unordered_map<RecordId, std::vector<RecordId>> children_;
  std::unordered_map<RecordId, RecordId> defaultChildren_;
  size_t liveRecords_ = 0;

  MatchCache cache_;
  std::unordered_map<std::string, Hotspot> hotspots_;
  bool preheated_ = false;

  uint64_t nextOrder_ = 0;
  uint64_t routesVersion_ = 0;
};

}  // namespace waypoint
