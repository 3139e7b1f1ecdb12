#include "waypoint/location.hpp"

#include <cctype>

#include "waypoint/route_record.hpp"

namespace waypoint {

namespace {

constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool isUnreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

}  // namespace

std::string normalizeHash(std::string_view hash) {
  if (hash.empty() || hash == "#") {
    return {};
  }
  if (hash.front() == '#') {
    return std::string(hash);
  }
  return "#" + std::string(hash);
}

std::string RawLocation::describe() const {
  if (name) {
    return "{name: " + *name + "}";
  }
  return buildFullPath(path, query, hash);
}

const ResolvedLocation& startLocation() {
  static const ResolvedLocation start = [] {
    ResolvedLocation location;
    location.path = "/";
    location.fullPath = "/";
    return location;
  }();
  return start;
}

ParsedUrl parseUrl(std::string_view url) {
  ParsedUrl parsed;

  auto hashPos = url.find('#');
  if (hashPos != std::string_view::npos) {
    parsed.hash = normalizeHash(url.substr(hashPos));
    url = url.substr(0, hashPos);
  }

  auto queryPos = url.find('?');
  if (queryPos != std::string_view::npos) {
    parsed.query = parseQuery(url.substr(queryPos + 1));
    url = url.substr(0, queryPos);
  }

  parsed.path = normalizePath(url);
  return parsed;
}

Query parseQuery(std::string_view search) {
  Query query;
  if (!search.empty() && search.front() == '?') {
    search.remove_prefix(1);
  }

  while (!search.empty()) {
    auto amp = search.find('&');
    std::string_view pair = search.substr(0, amp);
    search = amp == std::string_view::npos ? std::string_view{}
                                           : search.substr(amp + 1);
    if (pair.empty()) {
      continue;
    }

    auto eq = pair.find('=');
    std::string key = decodeComponent(pair.substr(0, eq), true);
    if (key.empty()) {
      continue;
    }
    std::string value = eq == std::string_view::npos
                            ? std::string{}
                            : decodeComponent(pair.substr(eq + 1), true);
    query[std::move(key)] = std::move(value);
  }

  return query;
}

std::string stringifyQuery(const Query& query) {
  std::string out;
  for (const auto& [key, value] : query) {
    if (!out.empty()) {
      out += '&';
    }
    out += encodeComponent(key);
    out += '=';
    out += encodeComponent(value);
  }
  return out;
}

std::string encodeComponent(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char ch : value) {
    auto c = static_cast<unsigned char>(ch);
    if (isUnreserved(c)) {
      out += ch;
    } else {
      out += '%';
      out += HEX_DIGITS[c >> 4];
      out += HEX_DIGITS[c & 0x0F];
    }
  }
  return out;
}

std::string decodeComponent(std::string_view value, bool plusAsSpace) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    char ch = value[i];
    if (ch == '%' && i + 2 < value.size()) {
      int hi = hexValue(value[i + 1]);
      int lo = hexValue(value[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out += static_cast<char>((hi << 4) | lo);
        i += 2;
        continue;
      }
    }
    if (ch == '+' && plusAsSpace) {
      out += ' ';
      continue;
    }
    out += ch;
  }
  return out;
}

std::string normalizePath(std::string_view path) {
  std::string out;
  out.reserve(path.size() + 1);
  out += '/';
  for (char ch : path) {
    if (ch == '/' && out.back() == '/') {
      continue;
    }
    out += ch;
  }
  if (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

std::string buildFullPath(std::string_view path, const Query& query,
                          std::string_view hash) {
  std::string fullPath(path);
  std::string search = stringifyQuery(query);
  if (!search.empty()) {
    fullPath += '?';
    fullPath += search;
  }
  fullPath += normalizeHash(hash);
  return fullPath;
}

bool isSameLocation(const ResolvedLocation& a, const ResolvedLocation& b) {
  auto leafA = a.leaf();
  auto leafB = b.leaf();
  if (!leafA || !leafB || leafA->id != leafB->id) {
    return false;
  }
  return a.path == b.path && a.query == b.query && a.hash == b.hash;
}

}  // namespace waypoint
