/**
 * @file router.hpp
 * @brief Composition root and imperative routing API
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "completion.hpp"
#include "current_route.hpp"
#include "error.hpp"
#include "guard.hpp"
#include "history.hpp"
#include "location.hpp"
#include "matcher_registry.hpp"
#include "navigation_pipeline.hpp"
#include "options.hpp"
#include "route_record.hpp"

namespace waypoint {

/**
 * @brief Client-side router
 *
 * Owns the route table, the current location and the navigation pipeline,
 * and drives one host history. Not a singleton: pass it by reference. All
 * calls must come from one execution context.
 */
class Router {
 public:
  /**
   * @param history Host history; must outlive the router
   * @param options Validated on construction
   * @throws InvalidConfigError
   */
  explicit Router(HistoryAdapter& history, RouterOptions options = RouterOptions{});
  ~Router();

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;

  // Registration

  Result<RecordId, CompileError> addRoute(const RouteDefinition& definition);

  /**
   * @brief Register a route nested under a named route
   * @throws ParentNotFoundError if no route carries parentName
   */
  Result<RecordId, CompileError> addRoute(std::string_view parentName,
                                          const RouteDefinition& definition);

  bool removeRoute(RecordId id) { return matcher_.removeRoute(id); }
  bool removeRoute(std::string_view name) { return matcher_.removeRoute(name); }
  bool hasRoute(std::string_view name) const { return matcher_.hasRoute(name); }
  std::vector<RecordPtr> getRoutes() const { return matcher_.getRoutes(); }

  // Resolution

  Result<ResolvedLocation, MatchNotFoundError> resolve(const RawLocation& target) {
    return matcher_.resolve(target);
  }

  // Navigation

  Completion<NavigationResult> push(RawLocation target);
  Completion<NavigationResult> replace(RawLocation target);

  /**
   * @brief Move through host history
   *
   * The completion settles with the navigation the resulting pop triggers.
   * go(0) settles at once as a Duplicated failure.
   */
  Completion<NavigationResult> go(int delta);
  Completion<NavigationResult> back() { return go(-1); }
  Completion<NavigationResult> forward() { return go(1); }

  /**
   * @brief Run the initial navigation to the host's current location
   *
   * Calling it again returns the first navigation's completion.
   */
  Completion<NavigationResult> start();

  /**
   * @brief Settles when the initial navigation has settled
   */
  Completion<NavigationResult> isReady() const { return ready_; }

  bool started() const noexcept { return started_; }

  // Guards

  Unregister beforeEach(Guard guard) { return pipeline_.beforeEach(std::move(guard)); }
  Unregister beforeResolve(Guard guard) {
    return pipeline_.beforeResolve(std::move(guard));
  }
  Unregister afterEach(AfterHook hook) { return pipeline_.afterEach(std::move(hook)); }
  Unregister onError(ErrorHandler handler) { return pipeline_.onError(std::move(handler)); }

  // Current location

  const ResolvedLocation& currentRoute() const noexcept { return current_.get(); }
  Unregister onRouteChange(RouteListener listener) {
    return current_.subscribe(std::move(listener));
  }

  const RouterOptions& options() const noexcept { return options_; }
  MatcherRegistry& matcher() noexcept { return matcher_; }
  const MatcherRegistry& matcher() const noexcept { return matcher_; }
  NavigationPipeline& pipeline() noexcept { return pipeline_; }
  HistoryAdapter& history() noexcept { return history_; }

 private:
  void handlePop(const std::string& to, PopInfo info);

  RouterOptions options_;
  HistoryAdapter& history_;
  MatcherRegistry matcher_;
  CurrentRoute current_;
  NavigationPipeline pipeline_;

  std::optional<Completion<NavigationResult>> pendingTraversal_;
  Completion<NavigationResult> ready_;
  bool started_ = false;
  Unregister unlisten_;
};

}  // namespace waypoint
