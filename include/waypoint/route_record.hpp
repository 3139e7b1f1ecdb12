/**
 * @file route_record.hpp
 * @brief Route definitions as registered and the immutable records they become
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "guard.hpp"
#include "location.hpp"

namespace waypoint {

using RecordId = uint32_t;

/**
 * @brief What a component loader hands back
 */
struct ComponentDescriptor {
  std::string name;
  nlohmann::json props = nlohmann::json::object();
};

/**
 * @brief Opaque, host-provided lazy component source
 *
 * Stored on records for the rendering layer. The routing core never calls
 * it.
 */
class ComponentLoader {
 public:
  virtual ~ComponentLoader() = default;

  virtual void load(std::function<void(const ComponentDescriptor&)> onLoaded) = 0;
};

/**
 * @brief A route as the application declares it
 */
struct RouteDefinition {
  std::string path;                      ///< Pattern, relative to parent if any
  std::optional<std::string> name;       ///< Unique route name
  nlohmann::json meta = nlohmann::json::object();  ///< Opaque metadata bag
  std::shared_ptr<ComponentLoader> component;      ///< Opaque loader
  std::optional<RawLocation> redirect;   ///< Unconditional redirect target
  std::vector<Guard> beforeEnter;        ///< Guards run when entering
  std::vector<Guard> beforeLeave;        ///< Guards run when leaving
  std::vector<RouteDefinition> children; ///< Nested routes

  RouteDefinition() = default;
  explicit RouteDefinition(std::string routePath) : path(std::move(routePath)) {}

  RouteDefinition& withName(std::string routeName) {
    name = std::move(routeName);
    return *this;
  }

  RouteDefinition& withMeta(nlohmann::json routeMeta) {
    meta = std::move(routeMeta);
    return *this;
  }

  RouteDefinition& withComponent(std::shared_ptr<ComponentLoader> loader) {
    component = std::move(loader);
    return *this;
  }

  RouteDefinition& withRedirect(RawLocation target) {
    redirect = std::move(target);
    return *this;
  }

  RouteDefinition& withBeforeEnter(Guard guard) {
    beforeEnter.push_back(std::move(guard));
    return *this;
  }

  RouteDefinition& withBeforeLeave(Guard guard) {
    beforeLeave.push_back(std::move(guard));
    return *this;
  }

  RouteDefinition& withChild(RouteDefinition child) {
    children.push_back(std::move(child));
    return *this;
  }
};

/**
 * @brief Normalized registration entry
 *
 * Immutable once created; shared between the arena, match results and
 * resolved locations. Parent links are ids into the registry's arena.
 */
struct RouteRecord {
  RecordId id = 0;
  std::string path;                   ///< Absolute pattern
  std::optional<std::string> name;
  std::optional<RecordId> parentId;
  nlohmann::json meta = nlohmann::json::object();
  std::shared_ptr<ComponentLoader> component;
  std::optional<RawLocation> redirect;
  std::vector<Guard> beforeEnter;
  std::vector<Guard> beforeLeave;
  std::string group;                  ///< Owning route group
  uint64_t order = 0;                 ///< Registration sequence number
  bool defaultChild = false;          ///< Registered with an empty path
};

}  // namespace waypoint
