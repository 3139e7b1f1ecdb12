/**
 * @file path_compiler.hpp
 * @brief Compilation of route pattern strings into typed segments
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "location.hpp"

namespace waypoint {

/**
 * @brief Kinds of compiled pattern segments
 */
enum class SegmentKind : uint8_t {
  Static,         ///< Literal text, matched exactly
  Param,          ///< ":name", one segment
  OptionalParam,  ///< ":name?", zero or one trailing segment
  Wildcard        ///< "*" or "*name", one or more trailing segments
};

/**
 * @brief One '/'-delimited unit of a compiled pattern
 */
struct CompiledSegment {
  SegmentKind kind;  ///< Segment kind
  std::string text;  ///< Literal for Static, parameter name otherwise

  static CompiledSegment literal(std::string value) {
    return {SegmentKind::Static, std::move(value)};
  }

  static CompiledSegment param(std::string name, bool optional = false) {
    return {optional ? SegmentKind::OptionalParam : SegmentKind::Param,
            std::move(name)};
  }

  static CompiledSegment wildcard(std::string name) {
    return {SegmentKind::Wildcard, std::move(name)};
  }

  bool isDynamic() const noexcept { return kind != SegmentKind::Static; }

  bool operator==(const CompiledSegment& other) const = default;
};

/**
 * @brief A pattern after compilation
 */
struct CompiledPattern {
  std::string pattern;                    ///< Source pattern
  std::vector<CompiledSegment> segments;  ///< Ordered segments

  /**
   * @brief Names of the dynamic segments, in order
   */
  std::vector<std::string> paramNames() const;

  bool isStatic() const noexcept;
  size_t staticCount() const noexcept;
};

/// Name given to an anonymous "*" wildcard
inline constexpr std::string_view DEFAULT_WILDCARD_NAME = "pathMatch";

/**
 * @brief Compile a route pattern
 * @param pattern Pattern such as "/user/:id/files/*"
 * @return Compiled segments or the reason the pattern is malformed
 */
Result<CompiledPattern, CompileError> compilePattern(std::string_view pattern);

/**
 * @brief Split a concrete path into percent-decoded segments
 *
 * Empty segments are dropped, so "/a//b/" yields {"a", "b"}.
 */
std::vector<std::string> splitPath(std::string_view path);

/**
 * @brief Fill a compiled pattern with parameter values
 *
 * Values are percent-encoded, except wildcard values whose '/' separators
 * are kept. An absent optional parameter drops its segment.
 */
Result<std::string, MissingParamError> buildPath(const CompiledPattern& pattern,
                                                 const Params& params);

}  // namespace waypoint
