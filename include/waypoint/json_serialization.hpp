/**
 * @file json_serialization.hpp
 * @brief JSON codecs for routes, locations, statistics and configuration
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "location.hpp"
#include "match_cache.hpp"
#include "matcher_registry.hpp"
#include "navigation_pipeline.hpp"
#include "options.hpp"
#include "route_record.hpp"

namespace waypoint {

/**
 * @brief JSON serialization utilities for the router core
 */
namespace json_serialization {

/**
 * @brief Convert a RawLocation to JSON
 */
void to_json(nlohmann::json& j, const RawLocation& location);

/**
 * @brief Parse a RawLocation from a path string or an object with
 * path/name, params, query and hash
 */
void from_json(const nlohmann::json& j, RawLocation& location);

/**
 * @brief Convert RouteRecord to JSON; guards and loaders appear as counts
 */
void to_json(nlohmann::json& j, const RouteRecord& record);

/**
 * @brief Convert ResolvedLocation to JSON; matched records appear as ids
 */
void to_json(nlohmann::json& j, const ResolvedLocation& location);

void to_json(nlohmann::json& j, const MatchResult& result);

void to_json(nlohmann::json& j, const NavigationFailure& failure);

void to_json(nlohmann::json& j, const CacheStats& stats);

void to_json(nlohmann::json& j, const Hotspot& hotspot);

void to_json(nlohmann::json& j, const RegistryStats& stats);

/**
 * @brief Parse a route definition with its children
 *
 * Recognised keys: path (required), name, meta, redirect, children.
 * Guards and component loaders cannot be expressed in JSON.
 *
 * @throws InvalidConfigError on a missing path or malformed field
 */
void from_json(const nlohmann::json& j, RouteDefinition& definition);

/**
 * @brief Parse cache options; absent keys keep their defaults
 * @throws InvalidConfigError if the result does not validate
 */
void from_json(const nlohmann::json& j, CacheOptions& options);

/**
 * @brief Parse router options; hotspotTtl is in milliseconds
 * @throws InvalidConfigError if the result does not validate
 */
void from_json(const nlohmann::json& j, RouterOptions& options);

/**
 * @brief Parse a route table (JSON array of route definitions)
 * @throws InvalidConfigError if the document is not an array of routes
 */
std::vector<RouteDefinition> loadRouteTable(const nlohmann::json& table);

/**
 * @brief Parse a route table from JSON text
 * @throws InvalidConfigError on a parse error
 */
std::vector<RouteDefinition> parseRouteTable(std::string_view text);

/**
 * @brief Get pretty printed JSON for registry statistics
 * @param stats Statistics snapshot
 * @param indent Number of spaces to indent (default: 2)
 */
std::string to_pretty_json(const RegistryStats& stats, int indent = 2);

}  // namespace json_serialization

}  // namespace waypoint
