/**
 * @file json_serialization.cpp
 * @brief JSON serialization implementation for the router core
 */

#include "waypoint/json_serialization.hpp"

#include "waypoint/error.hpp"

#include <chrono>

namespace waypoint {
namespace json_serialization {

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->template get<T>();
  }
}

nlohmann::json recordRef(const RecordPtr& record) {
  nlohmann::json j = nlohmann::json::object();
  if (!record) {
    return j;
  }
  j["id"] = record->id;
  j["path"] = record->path;
  if (record->name) {
    j["name"] = *record->name;
  }
  return j;
}

}  // namespace

void to_json(nlohmann::json& j, const RawLocation& location) {
  j = nlohmann::json::object();
  if (location.name) {
    j["name"] = *location.name;
    if (!location.params.empty()) {
      j["params"] = location.params;
    }
  } else {
    j["path"] = location.path;
  }
  if (!location.query.empty()) {
    j["query"] = location.query;
  }
  if (!location.hash.empty()) {
    j["hash"] = location.hash;
  }
  if (location.force) {
    j["force"] = true;
  }
}

void from_json(const nlohmann::json& j, RawLocation& location) {
  location = RawLocation{};
  if (j.is_string()) {
    location.path = j.get<std::string>();
    return;
  }
  if (!j.is_object()) {
    throw InvalidConfigError("location must be a string or an object");
  }

  if (j.contains("name")) {
    location.name = j.at("name").get<std::string>();
  } else if (j.contains("path")) {
    location.path = j.at("path").get<std::string>();
  } else {
    throw InvalidConfigError("location object needs a path or a name");
  }
  readIfPresent(j, "params", location.params);
  readIfPresent(j, "query", location.query);
  readIfPresent(j, "hash", location.hash);
  readIfPresent(j, "force", location.force);
}

void to_json(nlohmann::json& j, const RouteRecord& record) {
  j = nlohmann::json::object();
  j["id"] = record.id;
  j["path"] = record.path;
  if (record.name) {
    j["name"] = *record.name;
  }
  if (record.parentId) {
    j["parentId"] = *record.parentId;
  }
  j["group"] = record.group;
  j["meta"] = record.meta;
  if (record.redirect) {
    to_json(j["redirect"], *record.redirect);
  }
  if (record.defaultChild) {
    j["defaultChild"] = true;
  }
  j["hasComponent"] = record.component != nullptr;
  j["beforeEnter"] = record.beforeEnter.size();
  j["beforeLeave"] = record.beforeLeave.size();
}

void to_json(nlohmann::json& j, const ResolvedLocation& location) {
  j = nlohmann::json::object();
  j["path"] = location.path;
  j["fullPath"] = location.fullPath;
  if (location.name) {
    j["name"] = *location.name;
  }
  j["params"] = location.params;
  j["query"] = location.query;
  j["hash"] = location.hash;
  j["meta"] = location.meta;

  nlohmann::json matched = nlohmann::json::array();
  for (const auto& record : location.matched) {
    matched.push_back(recordRef(record));
  }
  j["matched"] = std::move(matched);

  if (location.redirectedFrom) {
    j["redirectedFrom"] = *location.redirectedFrom;
  }
}

void to_json(nlohmann::json& j, const MatchResult& result) {
  j = nlohmann::json::object();
  j["record"] = recordRef(result.record);
  j["params"] = result.params;

  nlohmann::json chain = nlohmann::json::array();
  for (const auto& record : result.matchedChain) {
    chain.push_back(record ? nlohmann::json(record->id) : nlohmann::json());
  }
  j["matchedChain"] = std::move(chain);
  j["score"] = {{"statics", result.score.statics}, {"loose", result.score.loose}};
}

void to_json(nlohmann::json& j, const NavigationFailure& failure) {
  j = nlohmann::json::object();
  j["type"] = static_cast<int>(failure.kind);
  j["kind"] = std::string(navigationFailureKindToString(failure.kind));
  j["from"] = failure.from.fullPath;
  j["to"] = failure.to.fullPath;
  j["message"] = failure.message();
}

void to_json(nlohmann::json& j, const CacheStats& stats) {
  j = nlohmann::json::object();
  j["enabled"] = stats.enabled;
  j["size"] = stats.size;
  j["capacity"] = stats.capacity;
  j["hits"] = stats.hits;
  j["misses"] = stats.misses;
  j["evictions"] = stats.evictions;
  j["invalidations"] = stats.invalidations;
  j["adjustments"] = stats.adjustments;
  j["hitRate"] = stats.hitRate();
}

void to_json(nlohmann::json& j, const Hotspot& hotspot) {
  j = nlohmann::json::object();
  j["path"] = hotspot.path;
  j["hits"] = hotspot.hits;
  j["avgMatchTimeUs"] =
      std::chrono::duration<double, std::micro>(hotspot.avgMatchTime).count();
}

void to_json(nlohmann::json& j, const RegistryStats& stats) {
  j = nlohmann::json::object();
  j["routes"] = stats.routes;
  j["groups"] = stats.groups;
  j["trieNodes"] = stats.trieNodes;
  j["routesVersion"] = stats.routesVersion;
  j["trackedPaths"] = stats.trackedPaths;
  j["preheated"] = stats.preheated;
  to_json(j["cache"], stats.cache);

  nlohmann::json hotspots = nlohmann::json::array();
  for (const auto& hotspot : stats.topHotspots) {
    nlohmann::json entry;
    to_json(entry, hotspot);
    hotspots.push_back(std::move(entry));
  }
  j["hotspots"] = std::move(hotspots);
}

void from_json(const nlohmann::json& j, RouteDefinition& definition) {
  if (!j.is_object()) {
    throw InvalidConfigError("route definition must be an object");
  }
  auto path = j.find("path");
  if (path == j.end() || !path->is_string()) {
    throw InvalidConfigError("route definition needs a string 'path'");
  }

  definition = RouteDefinition(path->get<std::string>());
  try {
    if (j.contains("name")) {
      definition.name = j.at("name").get<std::string>();
    }
    if (j.contains("meta")) {
      definition.meta = j.at("meta");
    }
    if (j.contains("redirect")) {
      RawLocation target;
      from_json(j.at("redirect"), target);
      definition.redirect = std::move(target);
    }
  } catch (const nlohmann::json::exception& e) {
    throw InvalidConfigError("route '" + definition.path + "': " + e.what());
  }

  auto children = j.find("children");
  if (children != j.end()) {
    if (!children->is_array()) {
      throw InvalidConfigError("route '" + definition.path +
                               "': children must be an array");
    }
    for (const auto& child : *children) {
      RouteDefinition nested;
      from_json(child, nested);
      definition.children.push_back(std::move(nested));
    }
  }
}

void from_json(const nlohmann::json& j, CacheOptions& options) {
  try {
    readIfPresent(j, "enabled", options.enabled);
    readIfPresent(j, "initialCapacity", options.initialCapacity);
    readIfPresent(j, "minCapacity", options.minCapacity);
    readIfPresent(j, "maxCapacity", options.maxCapacity);
    readIfPresent(j, "adjustInterval", options.adjustInterval);
    readIfPresent(j, "lowHitRate", options.lowHitRate);
    readIfPresent(j, "highHitRate", options.highHitRate);
    readIfPresent(j, "growStep", options.growStep);
    readIfPresent(j, "shrinkStep", options.shrinkStep);
  } catch (const nlohmann::json::exception& e) {
    throw InvalidConfigError(std::string("cache: ") + e.what());
  }
  options.validate();
}

void from_json(const nlohmann::json& j, RouterOptions& options) {
  if (j.contains("cache")) {
    from_json(j.at("cache"), options.cache);
  }
  try {
    readIfPresent(j, "maxRedirects", options.maxRedirects);
    readIfPresent(j, "hotspotLimit", options.hotspotLimit);
    readIfPresent(j, "logLevel", options.logLevel);
    if (j.contains("hotspotTtl")) {
      options.hotspotTtl = std::chrono::milliseconds(j.at("hotspotTtl").get<int64_t>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw InvalidConfigError(e.what());
  }
  options.validate();
}

std::vector<RouteDefinition> loadRouteTable(const nlohmann::json& table) {
  if (!table.is_array()) {
    throw InvalidConfigError("route table must be a JSON array");
  }
  std::vector<RouteDefinition> routes;
  routes.reserve(table.size());
  for (const auto& entry : table) {
    RouteDefinition definition;
    from_json(entry, definition);
    routes.push_back(std::move(definition));
  }
  return routes;
}

std::vector<RouteDefinition> parseRouteTable(std::string_view text) {
  nlohmann::json table;
  try {
    table = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw InvalidConfigError(std::string("route table: ") + e.what());
  }
  return loadRouteTable(table);
}

std::string to_pretty_json(const RegistryStats& stats, int indent) {
  nlohmann::json j;
  to_json(j, stats);
  return j.dump(indent);
}

}  // namespace json_serialization
}  // namespace waypoint
