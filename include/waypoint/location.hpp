/**
 * @file location.hpp
 * @brief Raw and resolved route locations, query and percent codecs
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace waypoint {

struct RouteRecord;

using Params = std::map<std::string, std::string>;
using Query = std::map<std::string, std::string>;
using RecordPtr = std::shared_ptr<const RouteRecord>;
using RecordChain = std::vector<RecordPtr>;

/**
 * @brief A navigation target as the caller wrote it
 *
 * Either a path (which may carry its own `?query` and `#hash`) or a route
 * name with parameters. Query and hash given here are merged over the ones
 * embedded in the path.
 */
struct RawLocation {
  std::string path;                 ///< Path, possibly with query and hash
  std::optional<std::string> name;  ///< Route name, takes precedence over path
  Params params;                    ///< Parameters for named locations
  Query query;                      ///< Extra query entries
  std::string hash;                 ///< Fragment, with or without leading '#'
  bool force = false;               ///< Navigate even to the current location

  RawLocation() = default;
  RawLocation(std::string p) : path(std::move(p)) {}
  RawLocation(const char* p) : path(p) {}

  static RawLocation named(std::string routeName, Params routeParams = {}) {
    RawLocation location;
    location.name = std::move(routeName);
    location.params = std::move(routeParams);
    return location;
  }

  RawLocation& withQuery(Query q) {
    query = std::move(q);
    return *this;
  }

  RawLocation& withHash(std::string h) {
    hash = std::move(h);
    return *this;
  }

  RawLocation& withForce(bool f = true) {
    force = f;
    return *this;
  }

  /**
   * @brief Human readable form used in errors and logs
   */
  std::string describe() const;
};

/**
 * @brief A location after matching against the route table
 */
struct ResolvedLocation {
  std::string path;                 ///< Normalized path without query/hash
  std::optional<std::string> name;  ///< Name of the leaf record, if any
  Params params;                    ///< Extracted parameters
  Query query;                      ///< Parsed query
  std::string hash;                 ///< Fragment including '#', or empty
  std::string fullPath;             ///< path + ?query + #hash
  RecordChain matched;              ///< Matched records, root to leaf
  nlohmann::json meta = nlohmann::json::object();  ///< Leaf record meta
  std::optional<std::string> redirectedFrom;  ///< First fullPath requested

  /**
   * @brief Leaf record of the match, or nullptr for an unmatched location
   */
  RecordPtr leaf() const { return matched.empty() ? nullptr : matched.back(); }
};

/**
 * @brief Split form of a URL-ish string
 */
struct ParsedUrl {
  std::string path;
  Query query;
  std::string hash;
};

/**
 * @brief The location a router reports before its first navigation
 */
const ResolvedLocation& startLocation();

/**
 * @brief Split "path?query#hash"
 */
ParsedUrl parseUrl(std::string_view url);

/**
 * @brief Parse "a=1&b=2" (a leading '?' is accepted)
 */
Query parseQuery(std::string_view search);

/**
 * @brief Serialize a query without the leading '?'
 */
std::string stringifyQuery(const Query& query);

/**
 * @brief Percent-encode a path segment or query component
 */
std::string encodeComponent(std::string_view value);

/**
 * @brief Percent-decode; malformed escapes are kept verbatim
 * @param plusAsSpace Treat '+' as a space (query strings)
 */
std::string decodeComponent(std::string_view value, bool plusAsSpace = false);

/**
 * @brief Collapse repeated slashes, force a leading slash and drop a
 * trailing one ("/" stays "/"). Query and hash must already be removed.
 */
std::string normalizePath(std::string_view path);

/**
 * @brief Hash with a leading '#', or empty for no fragment
 */
std::string normalizeHash(std::string_view hash);

/**
 * @brief Assemble path, query and hash into a full path
 */
std::string buildFullPath(std::string_view path, const Query& query,
                          std::string_view hash);

/**
 * @brief Same path, query, hash and leaf record
 */
bool isSameLocation(const ResolvedLocation& a, const ResolvedLocation& b);

}  // namespace waypoint
