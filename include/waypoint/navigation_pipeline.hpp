/**
 * @file navigation_pipeline.hpp
 * @brief Guard execution state machine deciding whether and where a
 * navigation commits
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "completion.hpp"
#include "current_route.hpp"
#include "error.hpp"
#include "guard.hpp"
#include "history.hpp"
#include "location.hpp"
#include "matcher_registry.hpp"
#include "options.hpp"

namespace waypoint {

enum class NavigationTrigger : uint8_t { Push, Replace, Pop };

/**
 * @brief Expected, non-exceptional ways a navigation does not commit
 */
enum class NavigationFailureKind : uint8_t {
  Redirected = 2,   ///< A redirect landed on the current location
  Aborted = 4,      ///< A guard aborted
  Cancelled = 8,    ///< A newer navigation superseded this one
  Duplicated = 16   ///< Target equals the current location
};

constexpr std::string_view navigationFailureKindToString(
    NavigationFailureKind kind) noexcept {
  switch (kind) {
    case NavigationFailureKind::Redirected:
      return "redirected";
    case NavigationFailureKind::Aborted:
      return "aborted";
    case NavigationFailureKind::Cancelled:
      return "cancelled";
    case NavigationFailureKind::Duplicated:
      return "duplicated";
  }
  return "unknown";
}

/**
 * @brief Plain value describing a navigation that did not commit
 */
struct NavigationFailure {
  NavigationFailureKind kind;
  ResolvedLocation from;
  ResolvedLocation to;

  std::string message() const;
};

enum class NavigationState : uint8_t {
  Idle,
  Pending,
  Confirmed,
  Aborted,
  Redirected,
  Failed,
  Cancelled
};

constexpr std::string_view navigationStateToString(NavigationState state) noexcept {
  switch (state) {
    case NavigationState::Idle:
      return "idle";
    case NavigationState::Pending:
      return "pending";
    case NavigationState::Confirmed:
      return "confirmed";
    case NavigationState::Aborted:
      return "aborted";
    case NavigationState::Redirected:
      return "redirected";
    case NavigationState::Failed:
      return "failed";
    case NavigationState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

/**
 * @brief Outcome of one navigation call
 *
 * Exactly one of: success, a NavigationFailure, or an error (GuardError,
 * RedirectLoopError, MatchNotFoundError, MissingParamError).
 */
class NavigationResult {
 public:
  static NavigationResult makeSuccess(ResolvedLocation to, ResolvedLocation from,
                                      uint64_t generation, uint32_t redirects);

  static NavigationResult makeFailure(NavigationFailure failure,
                                      uint64_t generation, uint32_t redirects);

  static NavigationResult makeError(std::shared_ptr<const WaypointError> error,
                                    ResolvedLocation to, ResolvedLocation from,
                                    uint64_t generation, uint32_t redirects);

  [[nodiscard]] bool ok() const noexcept { return state_ == NavigationState::Confirmed; }
  [[nodiscard]] bool isFailure() const noexcept { return failure_.has_value(); }
  [[nodiscard]] bool isError() const noexcept { return error_ != nullptr; }

  /**
   * @brief True for a failure of the given kind
   */
  [[nodiscard]] bool isFailure(NavigationFailureKind kind) const noexcept {
    return failure_ && failure_->kind == kind;
  }

  const std::optional<NavigationFailure>& failure() const noexcept { return failure_; }
  const std::shared_ptr<const WaypointError>& error() const noexcept { return error_; }

  const ResolvedLocation& to() const noexcept { return to_; }
  const ResolvedLocation& from() const noexcept { return from_; }
  NavigationState state() const noexcept { return state_; }
  uint64_t generation() const noexcept { return generation_; }
  uint32_t redirects() const noexcept { return redirects_; }

 private:
  NavigationResult() = default;

  NavigationState state_ = NavigationState::Idle;
  std::optional<NavigationFailure> failure_;
  std::shared_ptr<const WaypointError> error_;
  ResolvedLocation to_;
  ResolvedLocation from_;
  uint64_t generation_ = 0;
  uint32_t redirects_ = 0;
};

class NavigationRun;

/**
 * @brief Runs navigations through the guard phases and commits them
 *
 * Phases run strictly in order: beforeEach, leaving guards (leaf to root),
 * entering guards (root to leaf), beforeResolve. Every navigation gets a
 * generation number; only the newest one may commit. Guards may answer
 * synchronously or later, and any number of synchronous answers run in
 * constant stack depth.
 */
class NavigationPipeline {
 public:
  NavigationPipeline(MatcherRegistry& matcher, HistoryAdapter& history,
                     CurrentRoute& current, const RouterOptions& options);
  ~NavigationPipeline();

  NavigationPipeline(const NavigationPipeline&) = delete;
  NavigationPipeline& operator=(const NavigationPipeline&) = delete;

  /**
   * @brief Start a navigation
   * @param target Where to go
   * @param trigger Push or Replace commit to history; Pop means the host
   * already moved by pop.delta
   * @param pop Host movement for Pop navigations
   * @return Completion resolved once the navigation settles
   */
  Completion<NavigationResult> navigate(RawLocation target, NavigationTrigger trigger,
                                        PopInfo pop = {});

  Unregister beforeEach(Guard guard) { return beforeEach_.add(std::move(guard)); }
  Unregister beforeResolve(Guard guard) { return beforeResolve_.add(std::move(guard)); }
  Unregister afterEach(AfterHook hook) { return afterEach_.add(std::move(hook)); }
  Unregister onError(ErrorHandler handler) { return onError_.add(std::move(handler)); }

  /**
   * @brief Generation of the newest navigation started so far
   */
  uint64_t latestGeneration() const noexcept { return generation_; }

  /**
   * @brief Whether the newest navigation has not settled yet
   */
  bool pending() const noexcept { return settledGeneration_ < generation_; }

  /**
   * @brief Consume one pop notification caused by restoring the host position
   * @return True if the caller should ignore the pop it is handling
   */
  bool consumeSuppressedPop() noexcept;

  uint32_t maxRedirects() const noexcept { return maxRedirects_; }

 private:
  friend class NavigationRun;

  MatcherRegistry& matcher_;
  HistoryAdapter& history_;
  CurrentRoute& current_;
  uint32_t maxRedirects_;

  CallbackList<Guard> beforeEach_;
  CallbackList<Guard> beforeResolve_;
  CallbackList<AfterHook> afterEach_;
  CallbackList<ErrorHandler> onError_;

  uint64_t generation_ = 0;
  uint64_t settledGeneration_ = 0;
  uint32_t suppressedPops_ = 0;
  std::shared_ptr<bool> alive_;
};

}  // namespace waypoint
