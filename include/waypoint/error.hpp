/**
 * @file error.hpp
 * @brief Error classes and exception hierarchy for the router core
 */

#pragma once

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace waypoint {

/**
 * @brief Error codes for programmatic error handling
 */
enum class WaypointErrorCode : uint32_t {
  INVALID_PATTERN = 1000,
  MISSING_PARAMETER = 1001,
  INVALID_LOCATION = 1002,
  ROUTE_NOT_FOUND = 2000,
  PARENT_NOT_FOUND = 2001,
  GUARD_FAILED = 3000,
  REDIRECT_LOOP = 3001,
  INVALID_CONFIG = 4000
};

/**
 * @brief Convert error code to string description
 */
constexpr std::string_view errorCodeToString(WaypointErrorCode code) noexcept {
  switch (code) {
    case WaypointErrorCode::INVALID_PATTERN:
      return "Invalid route pattern";
    case WaypointErrorCode::MISSING_PARAMETER:
      return "Missing route parameter";
    case WaypointErrorCode::INVALID_LOCATION:
      return "Invalid route location";
    case WaypointErrorCode::ROUTE_NOT_FOUND:
      return "No matching route";
    case WaypointErrorCode::PARENT_NOT_FOUND:
      return "Parent route not found";
    case WaypointErrorCode::GUARD_FAILED:
      return "Navigation guard failed";
    case WaypointErrorCode::REDIRECT_LOOP:
      return "Too many navigation redirects";
    case WaypointErrorCode::INVALID_CONFIG:
      return "Invalid router configuration";
    default:
      return "Unknown error";
  }
}

/**
 * @brief Base exception class for all router errors
 */
class WaypointError : public std::runtime_error {
 public:
  /**
   * @brief Construct an error with message and error code
   * @param code Error code
   * @param message Error description (optional, uses default if empty)
   */
  explicit WaypointError(WaypointErrorCode code, std::string_view message = {})
      : std::runtime_error(message.empty()
                               ? std::string(errorCodeToString(code))
                               : std::string(message)),
        error_code_(code) {}

  /**
   * @brief Get the error code
   * @return The error code
   */
  [[nodiscard]] WaypointErrorCode errorCode() const noexcept {
    return error_code_;
  }

 private:
  WaypointErrorCode error_code_;
};

/**
 * @brief Reasons a route pattern fails to compile
 */
enum class CompileErrorKind : uint8_t {
  UnterminatedParam,
  WildcardNotLast,
  MultipleWildcards,
  OptionalNotLast,
  DuplicateParamName
};

constexpr std::string_view compileErrorKindToString(
    CompileErrorKind kind) noexcept {
  switch (kind) {
    case CompileErrorKind::UnterminatedParam:
      return "unterminated parameter token";
    case CompileErrorKind::WildcardNotLast:
      return "wildcard must be the final segment";
    case CompileErrorKind::MultipleWildcards:
      return "more than one wildcard";
    case CompileErrorKind::OptionalNotLast:
      return "optional parameter must be the final segment";
    case CompileErrorKind::DuplicateParamName:
      return "duplicate parameter name";
    default:
      return "unknown";
  }
}

/**
 * @brief Malformed route pattern, reported at registration time
 */
class CompileError : public WaypointError {
 public:
  CompileError(CompileErrorKind kind, std::string_view pattern)
      : WaypointError(WaypointErrorCode::INVALID_PATTERN,
                      std::string("Invalid route pattern '") +
                          std::string(pattern) +
                          "': " + std::string(compileErrorKindToString(kind))),
        kind_(kind),
        pattern_(pattern) {}

  [[nodiscard]] CompileErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

 private:
  CompileErrorKind kind_;
  std::string pattern_;
};

class MissingParamError : public WaypointError {
 public:
  explicit MissingParamError(std::string_view param)
      : WaypointError(WaypointErrorCode::MISSING_PARAMETER,
                      std::string("Missing required parameter: ") +
                          std::string(param)) {}
};

class InvalidLocationError : public WaypointError {
 public:
  explicit InvalidLocationError(std::string_view details)
      : WaypointError(WaypointErrorCode::INVALID_LOCATION,
                      std::string("Invalid route location: ") +
                          std::string(details)) {}
};

/**
 * @brief No registered route matches a location
 */
class MatchNotFoundError : public WaypointError {
 public:
  explicit MatchNotFoundError(std::string_view target)
      : WaypointError(WaypointErrorCode::ROUTE_NOT_FOUND,
                      std::string("No match found for: ") +
                          std::string(target)),
        target_(target) {}

  [[nodiscard]] const std::string& target() const noexcept { return target_; }

 private:
  std::string target_;
};

class ParentNotFoundError : public WaypointError {
 public:
  explicit ParentNotFoundError(std::string_view parent)
      : WaypointError(WaypointErrorCode::PARENT_NOT_FOUND,
                      std::string("Parent route not found: ") +
                          std::string(parent)) {}
};

/**
 * @brief A navigation guard threw or reported an error
 *
 * The original exception is kept and can be rethrown through cause().
 */
class GuardError : public WaypointError {
 public:
  GuardError(std::string_view details, std::exception_ptr cause)
      : WaypointError(WaypointErrorCode::GUARD_FAILED,
                      std::string("Navigation guard failed: ") +
                          std::string(details)),
        cause_(std::move(cause)) {}

  [[nodiscard]] const std::exception_ptr& cause() const noexcept {
    return cause_;
  }

 private:
  std::exception_ptr cause_;
};

/**
 * @brief Exception for exceeding the redirect-hop bound
 */
class RedirectLoopError : public WaypointError {
 public:
  explicit RedirectLoopError(uint32_t hops)
      : WaypointError(WaypointErrorCode::REDIRECT_LOOP,
                      std::string("Maximum redirect limit (") +
                          std::to_string(hops) + ") exceeded"),
        hops_(hops) {}

  [[nodiscard]] uint32_t hops() const noexcept { return hops_; }

 private:
  uint32_t hops_;
};

class InvalidConfigError : public WaypointError {
 public:
  explicit InvalidConfigError(std::string_view details)
      : WaypointError(WaypointErrorCode::INVALID_CONFIG,
                      std::string("Invalid router configuration: ") +
                          std::string(details)) {}
};

/**
 * @brief Result type for error handling without exceptions
 * Inspired by Rust's Result and C++23's std::expected
 */
template <typename T, typename E = WaypointError>
class Result {
 public:
  // Constructors
  Result(const T& value) : data_(value) {}
  Result(T&& value) : data_(std::move(value)) {}
  Result(const E& error) : data_(error) {}
  Result(E&& error) : data_(std::move(error)) {}

  // Query methods
  bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  bool isError() const noexcept { return std::holds_alternative<E>(data_); }
  explicit operator bool() const noexcept { return isSuccess(); }

  // Value access (throws if error)
  const T& value() const& {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T& value() & {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::get<T>(data_);
  }

  T&& value() && {
    if (isError()) {
      throw std::get<E>(data_);
    }
    return std::move(std::get<T>(data_));
  }

  // Error access
  const E& error() const& {
    if (isSuccess()) {
      throw std::logic_error("Accessing error on successful result");
    }
    return std::get<E>(data_);
  }

 private:
  std::variant<T, E> data_;
};

}  // namespace waypoint
