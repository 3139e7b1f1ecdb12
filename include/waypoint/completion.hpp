/**
 * @file completion.hpp
 * @brief Single-threaded deferred value with continuations
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace waypoint {

/**
 * @brief A value that becomes available later on the same thread
 *
 * Copies share one state. The producer calls resolve() once; consumers
 * attach continuations with then(), which run immediately when the value is
 * already there. Continuations run in attachment order on the resolving
 * call stack. Not thread-safe: the router runs on one execution context.
 *
 * @tparam T Value type
 */
template <typename T>
class Completion {
 public:
  using Continuation = std::function<void(const T&)>;

  Completion() : state_(std::make_shared<State>()) {}

  /**
   * @brief Create an already resolved completion
   */
  static Completion resolved(T value) {
    Completion completion;
    completion.resolve(std::move(value));
    return completion;
  }

  /**
   * @brief Check whether the value is available
   */
  [[nodiscard]] bool ready() const noexcept { return state_->value.has_value(); }

  /**
   * @brief Access the value
   * @throws std::logic_error if the completion is still pending
   */
  const T& value() const {
    if (!state_->value) {
      throw std::logic_error("Completion is still pending");
    }
    return *state_->value;
  }

  /**
   * @brief Attach a continuation
   */
  const Completion& then(Continuation continuation) const {
    if (state_->value) {
      continuation(*state_->value);
    } else {
      state_->continuations.push_back(std::move(continuation));
    }
    return *this;
  }

  /**
   * @brief Provide the value and run pending continuations
   * @return False if the completion was already resolved
   */
  bool resolve(T value) const {
    auto state = state_;
    if (state->value) {
      return false;
    }
    state->value.emplace(std::move(value));

    auto pending = std::move(state->continuations);
    state->continuations.clear();
    for (auto& continuation : pending) {
      continuation(*state->value);
    }
    return true;
  }

 private:
  struct State {
    std::optional<T> value;
    std::vector<Continuation> continuations;
  };

  std::shared_ptr<State> state_;
};

}  // namespace waypoint
