#include "waypoint/path_compiler.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace waypoint {

namespace {

bool isParamNameChar(char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' ||
         ch == '-';
}

bool isValidParamName(std::string_view name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), isParamNameChar);
}

std::vector<std::string_view> splitRaw(std::string_view path) {
  std::vector<std::string_view> parts;
  size_t start = 0;
  while (start <= path.size()) {
    auto slash = path.find('/', start);
    auto end = slash == std::string_view::npos ? path.size() : slash;
    if (end > start) {
      parts.push_back(path.substr(start, end - start));
    }
    if (slash == std::string_view::npos) {
      break;
    }
    start = slash + 1;
  }
  return parts;
}

}  // namespace

std::vector<std::string> CompiledPattern::paramNames() const {
  std::vector<std::string> names;
  for (const auto& segment : segments) {
    if (segment.isDynamic()) {
      names.push_back(segment.text);
    }
  }
  return names;
}

bool CompiledPattern::isStatic() const noexcept {
  return std::none_of(segments.begin(), segments.end(),
                      [](const CompiledSegment& s) { return s.isDynamic(); });
}

size_t CompiledPattern::staticCount() const noexcept {
  return static_cast<size_t>(
      std::count_if(segments.begin(), segments.end(),
                    [](const CompiledSegment& s) { return !s.isDynamic(); }));
}

Result<CompiledPattern, CompileError> compilePattern(std::string_view pattern) {
  CompiledPattern compiled;
  compiled.pattern = std::string(pattern);

  size_t wildcards = 0;
  for (std::string_view raw : splitRaw(pattern)) {
    if (raw.front() == ':') {
      std::string_view name = raw.substr(1);
      bool optional = false;
      if (!name.empty() && name.back() == '?') {
        optional = true;
        name.remove_suffix(1);
      }
      if (!isValidParamName(name)) {
        return CompileError(CompileErrorKind::UnterminatedParam, pattern);
      }
      compiled.segments.push_back(
          CompiledSegment::param(std::string(name), optional));
    } else if (raw.front() == '*') {
      std::string_view name = raw.substr(1);
      if (name.empty()) {
        name = DEFAULT_WILDCARD_NAME;
      } else if (!isValidParamName(name)) {
        return CompileError(CompileErrorKind::UnterminatedParam, pattern);
      }
      ++wildcards;
      compiled.segments.push_back(CompiledSegment::wildcard(std::string(name)));
    } else {
      // Stored decoded, matching the form splitPath() produces
      compiled.segments.push_back(CompiledSegment::literal(decodeComponent(raw)));
    }
  }

  if (wildcards > 1) {
    return CompileError(CompileErrorKind::MultipleWildcards, pattern);
  }

  std::unordered_set<std::string> seen;
  for (size_t i = 0; i < compiled.segments.size(); ++i) {
    const auto& segment = compiled.segments[i];
    bool last = i + 1 == compiled.segments.size();
    if (segment.kind == SegmentKind::Wildcard && !last) {
      return CompileError(CompileErrorKind::WildcardNotLast, pattern);
    }
    if (segment.kind == SegmentKind::OptionalParam && !last) {
      return CompileError(CompileErrorKind::OptionalNotLast, pattern);
    }
    if (segment.isDynamic() && !seen.insert(segment.text).second) {
      return CompileError(CompileErrorKind::DuplicateParamName, pattern);
    }
  }

  return compiled;
}

std::vector<std::string> splitPath(std::string_view path) {
  std::vector<std::string> segments;
  for (std::string_view raw : splitRaw(path)) {
    segments.push_back(decodeComponent(raw));
  }
  return segments;
}

Result<std::string, MissingParamError> buildPath(const CompiledPattern& pattern,
                                                 const Params& params) {
  std::string path;
  for (const auto& segment : pattern.segments) {
    if (segment.kind == SegmentKind::Static) {
      path += '/';
      path += encodeComponent(segment.text);
      continue;
    }

    auto it = params.find(segment.text);
    if (it == params.end() || it->second.empty()) {
      if (segment.kind == SegmentKind::OptionalParam) {
        continue;
      }
      return MissingParamError(segment.text);
    }

    path += '/';
    if (segment.kind == SegmentKind::Wildcard) {
      bool first = true;
      for (std::string_view part : splitRaw(it->second)) {
        if (!first) {
          path += '/';
        }
        path += encodeComponent(part);
        first = false;
      }
    } else {
      path += encodeComponent(it->second);
    }
  }

  return path.empty() ? std::string("/") : path;
}

}  // namespace waypoint
