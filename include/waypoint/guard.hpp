/**
 * @file guard.hpp
 * @brief Navigation guard contract and callback registries
 */

#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "location.hpp"

namespace waypoint {

/**
 * @brief What a guard decided
 */
enum class GuardAction : uint8_t {
  Continue,  ///< Let the navigation proceed to the next guard
  Abort,     ///< Stop the navigation, location unchanged
  Redirect,  ///< Restart the navigation against another target
  Error      ///< The guard failed
};

/**
 * @brief Uniform answer of every guard, synchronous or not
 */
class GuardResult {
 public:
  static GuardResult proceed() { return GuardResult(GuardAction::Continue); }

  static GuardResult abort() { return GuardResult(GuardAction::Abort); }

  static GuardResult redirect(RawLocation target) {
    GuardResult result(GuardAction::Redirect);
    result.redirect_ = std::move(target);
    return result;
  }

  static GuardResult fail(std::exception_ptr error) {
    GuardResult result(GuardAction::Error);
    result.error_ = std::move(error);
    return result;
  }

  static GuardResult fail(const std::string& message) {
    return fail(std::make_exception_ptr(std::runtime_error(message)));
  }

  [[nodiscard]] GuardAction action() const noexcept { return action_; }
  [[nodiscard]] const std::optional<RawLocation>& redirectTarget() const noexcept {
    return redirect_;
  }
  [[nodiscard]] const std::exception_ptr& error() const noexcept {
    return error_;
  }

 private:
  explicit GuardResult(GuardAction action) : action_(action) {}

  GuardAction action_;
  std::optional<RawLocation> redirect_;
  std::exception_ptr error_;
};

/// Receives a guard's answer; may be called later than the guard returns
using GuardCallback = std::function<void(GuardResult)>;

/**
 * @brief A navigation guard
 *
 * The guard must call `done` exactly once, either before returning or at a
 * later point on the same execution context. Throwing counts as an error.
 */
using Guard = std::function<void(const ResolvedLocation& to,
                                 const ResolvedLocation& from,
                                 GuardCallback done)>;

/// Guard that answers immediately
using SyncGuard = std::function<GuardResult(const ResolvedLocation& to,
                                            const ResolvedLocation& from)>;

/// Runs after a navigation is confirmed
using AfterHook =
    std::function<void(const ResolvedLocation& to, const ResolvedLocation& from)>;

/// Receives navigation errors
using ErrorHandler = std::function<void(const WaypointError& error)>;

/// Removes a previously registered callback; safe to call more than once
using Unregister = std::function<void()>;

/**
 * @brief Adapt a synchronous guard to the callback contract
 */
inline Guard syncGuard(SyncGuard guard) {
  return [guard = std::move(guard)](const ResolvedLocation& to,
                                    const ResolvedLocation& from,
                                    GuardCallback done) {
    done(guard(to, from));
  };
}

/**
 * @brief Registration-ordered list of callbacks with handle-based removal
 *
 * Iteration goes through snapshot(), so a callback may unregister itself or
 * others while the list is being walked.
 */
template <typename Fn>
class CallbackList {
 public:
  CallbackList() : entries_(std::make_shared<Entries>()) {}

  /**
   * @brief Append a callback
   * @return Function object that removes it again
   */
  Unregister add(Fn fn) {
    uint64_t id = ++nextId_;
    entries_->emplace_back(id, std::move(fn));
    std::weak_ptr<Entries> weak = entries_;
    return [weak, id]() {
      if (auto entries = weak.lock()) {
        std::erase_if(*entries,
                      [id](const auto& entry) { return entry.first == id; });
      }
    };
  }

  std::vector<Fn> snapshot() const {
    std::vector<Fn> fns;
    fns.reserve(entries_->size());
    for (const auto& entry : *entries_) {
      fns.push_back(entry.second);
    }
    return fns;
  }

  size_t size() const noexcept { return entries_->size(); }
  bool empty() const noexcept { return entries_->empty(); }
  void clear() noexcept { entries_->clear(); }

 private:
  using Entries = std::vector<std::pair<uint64_t, Fn>>;

  std::shared_ptr<Entries> entries_;
  uint64_t nextId_ = 0;
};

}  // namespace waypoint
