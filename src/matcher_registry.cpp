#include "waypoint/matcher_registry.hpp"

#include <algorithm>

#include "waypoint/logging.hpp"

namespace waypoint {

namespace {

constexpr size_t PREHEAT_HOTSPOTS = 20;

}  // namespace

MatcherRegistry::MatcherRegistry(const RouterOptions& options, Clock clock)
    : options_(options), clock_(std::move(clock)), cache_(options.cache) {
  options_.validate();
  if (!clock_) {
    clock_ = [] { return std::chrono::steady_clock::now(); };
  }
  arena_.push_back(nullptr);
}

std::optional<CompileError> MatcherRegistry::plan(
    const RouteDefinition& definition, std::string_view parentPath,
    std::optional<size_t> parentIndex, std::vector<Planned>& out) const {
  bool nested = parentIndex.has_value() || !parentPath.empty();
  bool defaultChild = false;
  std::string raw;

  if (!nested) {
    raw = definition.path;
  } else if (definition.path.empty()) {
    defaultChild = true;
    raw = std::string(parentPath);
  } else if (definition.path.front() == '/') {
    raw = definition.path;
  } else {
    raw = std::string(parentPath) + "/" + definition.path;
  }

  auto compiled = compilePattern(normalizePath(raw));
  if (compiled.isError()) {
    return compiled.error();
  }

  size_t index = out.size();
  out.push_back(Planned{&definition, std::move(compiled).value(), parentIndex,
                        defaultChild});

  // Copy: out may reallocate while children are planned
  std::string path = out[index].pattern.pattern;
  for (const auto& child : definition.children) {
    if (auto error = plan(child, path, index, out)) {
      return error;
    }
  }
  return std::nullopt;
}

Result<RecordId, CompileError> MatcherRegistry::addRoute(
    const RouteDefinition& definition, std::optional<RecordId> parent,
    std::string_view group) {
  RecordPtr parentRecord;
  if (parent) {
    parentRecord = getRecord(*parent);
    if (!parentRecord) {
      throw ParentNotFoundError(std::to_string(*parent));
    }
  }

  std::vector<Planned> planned;
  if (auto error = plan(definition, parentRecord ? parentRecord->path : std::string{},
                        std::nullopt, planned)) {
    WPT_LOG_WARN("Rejected route '{}': {}", definition.path, error->what());
    return *error;
  }

  // A name already in use is replaced, unless the new route nests under it.
  // All conflicts are checked before anything is removed.
  std::vector<RecordId> replaced;
  for (const auto& entry : planned) {
    const auto& name = entry.definition->name;
    if (!name) {
      continue;
    }
    auto existing = names_.find(*name);
    if (existing == names_.end()) {
      continue;
    }
    if (parentRecord) {
      for (const auto& ancestor : chainOf(parentRecord->id)) {
        if (ancestor->id == existing->second) {
          throw ParentNotFoundError(*name + " (replaced by its own child)");
        }
      }
    }
    replaced.push_back(existing->second);
  }
  for (RecordId id : replaced) {
    if (getRecord(id)) {
      WPT_LOG_DEBUG("Replacing route named '{}'", *getRecord(id)->name);
      removeRoute(id);
    }
  }

  std::string groupName =
      parentRecord ? parentRecord->group : std::string(group);
  RouteTrie& trie = ensureGroup(groupName);

  std::vector<RecordId> ids;
  ids.reserve(planned.size());

  for (const auto& entry : planned) {
    const RouteDefinition& def = *entry.definition;
    auto id = static_cast<RecordId>(arena_.size());

    std::optional<RecordId> parentId;
    if (entry.parentIndex) {
      parentId = ids[*entry.parentIndex];
    } else if (parentRecord) {
      parentId = parentRecord->id;
    }

    auto record = std::make_shared<RouteRecord>();
    record->id = id;
    record->path = entry.pattern.pattern;
    record->name = def.name;
    record->parentId = parentId;
    record->meta = def.meta;
    record->component = def.component;
    record->redirect = def.redirect;
    record->beforeEnter = def.beforeEnter;
    record->beforeLeave = def.beforeLeave;
    record->group = groupName;
    record->order = nextOrder_++;
    record->defaultChild = entry.defaultChild;

    arena_.push_back(record);
    ids.push_back(id);

    if (entry.defaultChild) {
      defaultChildren_.try_emplace(*parentId, id);
    } else {
      trie.insert(entry.pattern, id, record->order, def.name);
    }
    if (parentId) {
      children_[*parentId].push_back(id);
    }
    if (def.name) {
      names_[*def.name] = id;
    }
    patterns_.emplace(id, entry.pattern);
    ++liveRecords_;
  }

  // A new pattern can outrank a cached hit on another key (adding
  // /user/profile changes the answer for a cached /user/:id hit), so every
  // cached entry goes stale, not only the exact key.
  ++routesVersion_;
  WPT_LOG_INFO("Registered {} route(s) under '{}' in group '{}'", ids.size(),
               planned.front().pattern.pattern, groupName);
  return ids.front();
}

bool MatcherRegistry::removeRoute(RecordId id) {
  if (!getRecord(id)) {
    return false;
  }

  std::vector<RecordId> doomed;
  collectDescendants(id, doomed);
  for (auto it = doomed.rbegin(); it != doomed.rend(); ++it) {
    eraseRecord(*it);
  }

  // Cached hits on other keys may have matched the removed patterns
  ++routesVersion_;
  WPT_LOG_INFO("Removed {} route(s) starting at id {}", doomed.size(), id);
  return true;
}

bool MatcherRegistry::removeRoute(std::string_view name) {
  auto it = names_.find(std::string(name));
  if (it == names_.end()) {
    return false;
  }
  return removeRoute(it->second);
}

void MatcherRegistry::collectDescendants(RecordId id,
                                         std::vector<RecordId>& out) const {
  out.push_back(id);
  auto it = children_.find(id);
  if (it == children_.end()) {
    return;
  }
  for (RecordId child : it->second) {
    collectDescendants(child, out);
  }
}

void MatcherRegistry::eraseRecord(RecordId id) {
  RecordPtr record = getRecord(id);
  if (!record) {
    return;
  }

  const CompiledPattern& pattern = patterns_.at(id);
  if (!record->defaultChild) {
    if (RouteTrie* trie = findGroup(record->group)) {
      trie->remove(id);
    }
  }
  if (pattern.isStatic()) {
    cache_.invalidate(pattern.pattern);
  }

  if (record->name) {
    auto nameIt = names_.find(*record->name);
    if (nameIt != names_.end() && nameIt->second == id) {
      names_.erase(nameIt);
    }
  }

  defaultChildren_.erase(id);
  children_.erase(id);

  if (record->parentId) {
    RecordId parentId = *record->parentId;
    auto siblings = children_.find(parentId);
    if (siblings != children_.end()) {
      std::erase(siblings->second, id);
    }

    auto current = defaultChildren_.find(parentId);
    if (current != defaultChildren_.end() && current->second == id) {
      defaultChildren_.erase(current);
      // Promote the next empty-path child, if any
      if (siblings != children_.end()) {
        for (RecordId sibling : siblings->second) {
          if (arena_[sibling] && arena_[sibling]->defaultChild) {
            defaultChildren_.emplace(parentId, sibling);
            break;
          }
        }
      }
    }
  }

  patterns_.erase(id);
  arena_[id] = nullptr;
  --liveRecords_;
}

MatchResultPtr MatcherRegistry::match(std::string_view path) {
  std::string key = parseUrl(path).path;
  auto started = clock_();

  MatchResultPtr result;
  if (auto cached = cache_.get(key, routesVersion_)) {
    result = std::move(*cached);
  } else {
    result = matchUncached(key);
    cache_.set(key, result, routesVersion_);
  }

  recordHotspot(key, std::chrono::duration_cast<std::chrono::nanoseconds>(
                         clock_() - started));
  return result;
}

MatchResultPtr MatcherRegistry::matchUncached(std::string_view normalizedPath) const {
  auto segments = splitPath(normalizedPath);
  for (const auto& group : groups_) {
    if (auto found = group.trie.match(segments)) {
      return buildResult(found->id, std::move(found->params), found->specificity);
    }
  }
  return nullptr;
}

MatchResultPtr MatcherRegistry::buildResult(RecordId id, Params params,
                                            Specificity score) const {
  RecordId leaf = id;
  for (auto it = defaultChildren_.find(leaf); it != defaultChildren_.end();
       it = defaultChildren_.find(leaf)) {
    leaf = it->second;
  }

  auto result = std::make_shared<MatchResult>();
  result->record = getRecord(leaf);
  result->params = std::move(params);
  result->matchedChain = chainOf(leaf);
  result->score = score;
  return result;
}

Result<ResolvedLocation, MatchNotFoundError> MatcherRegistry::resolve(
    const RawLocation& raw) {
  ResolvedLocation resolved;
  MatchResultPtr matched;

  if (raw.name) {
    RecordPtr record = matchByName(*raw.name);
    if (!record) {
      return MatchNotFoundError(raw.describe());
    }

    const CompiledPattern& pattern = patterns_.at(record->id);
    resolved.path = buildPath(pattern, raw.params).value();

    Params params;
    for (const auto& name : pattern.paramNames()) {
      auto it = raw.params.find(name);
      if (it != raw.params.end() && !it->second.empty()) {
        params.emplace(name, it->second);
      }
    }
    Specificity score{static_cast<int32_t>(pattern.staticCount()), 0};
    matched = buildResult(record->id, std::move(params), score);
    resolved.query = raw.query;
    resolved.hash = normalizeHash(raw.hash);
  } else {
    ParsedUrl parsed = parseUrl(raw.path);
    matched = match(parsed.path);
    if (!matched) {
      return MatchNotFoundError(raw.describe());
    }

    resolved.path = std::move(parsed.path);
    resolved.query = std::move(parsed.query);
    for (const auto& [key, value] : raw.query) {
      resolved.query[key] = value;
    }
    resolved.hash = raw.hash.empty() ? parsed.hash : normalizeHash(raw.hash);
  }

  resolved.name = matched->record->name;
  resolved.params = matched->params;
  resolved.matched = matched->matchedChain;
  resolved.meta = matched->record->meta;
  resolved.fullPath = buildFullPath(resolved.path, resolved.query, resolved.hash);
  return resolved;
}

RecordPtr MatcherRegistry::matchByName(std::string_view name) const {
  auto it = names_.find(std::string(name));
  return it == names_.end() ? nullptr : getRecord(it->second);
}

RecordPtr MatcherRegistry::getRecord(RecordId id) const {
  return id < arena_.size() ? arena_[id] : nullptr;
}

bool MatcherRegistry::hasRoute(std::string_view name) const {
  return names_.count(std::string(name)) > 0;
}

std::vector<RecordPtr> MatcherRegistry::getRoutes() const {
  std::vector<RecordPtr> routes;
  routes.reserve(liveRecords_);
  for (const auto& record : arena_) {
    if (record) {
      routes.push_back(record);
    }
  }
  return routes;
}

RecordChain MatcherRegistry::chainOf(RecordId id) const {
  RecordChain chain;
  for (RecordPtr record = getRecord(id); record;
       record = record->parentId ? getRecord(*record->parentId) : nullptr) {
    chain.push_back(record);
  }
  std::reverse(chain.begin(), chain.end());
  return chain;
}

std::vector<RecordId> MatcherRegistry::childrenOf(RecordId id) const {
  auto it = children_.find(id);
  return it == children_.end() ? std::vector<RecordId>{} : it->second;
}

RouteTrie& MatcherRegistry::ensureGroup(std::string_view name) {
  if (RouteTrie* trie = findGroup(name)) {
    return *trie;
  }
  groups_.push_back(Group{std::string(name), RouteTrie{}});
  WPT_LOG_DEBUG("Created route group '{}'", name);
  return groups_.back().trie;
}

RouteTrie* MatcherRegistry::findGroup(std::string_view name) {
  for (auto& group : groups_) {
    if (group.name == name) {
      return &group.trie;
    }
  }
  return nullptr;
}

std::vector<std::string> MatcherRegistry::groups() const {
  std::vector<std::string> names;
  names.reserve(groups_.size());
  for (const auto& group : groups_) {
    names.push_back(group.name);
  }
  return names;
}

void MatcherRegistry::recordHotspot(const std::string& path,
                                    std::chrono::nanoseconds elapsed) {
  auto& hotspot = hotspots_[path];
  if (hotspot.path.empty()) {
    hotspot.path = path;
  }
  ++hotspot.hits;
  hotspot.lastAccess = clock_();
  hotspot.avgMatchTime +=
      (elapsed - hotspot.avgMatchTime) / static_cast<int64_t>(hotspot.hits);

  if (hotspots_.size() > options_.hotspotLimit) {
    cleanupHotspots();
  }
}

void MatcherRegistry::cleanupHotspots() {
  auto now = clock_();
  size_t before = hotspots_.size();
  std::erase_if(hotspots_, [&](const auto& entry) {
    return now - entry.second.lastAccess > options_.hotspotTtl;
  });

  // Trim below the limit so the next cleanup is a batch away
  size_t target = options_.hotspotLimit - std::max<size_t>(1, options_.hotspotLimit / 10);
  if (hotspots_.size() > options_.hotspotLimit) {
    std::vector<const Hotspot*> ranked;
    ranked.reserve(hotspots_.size());
    for (const auto& [_, hotspot] : hotspots_) {
      ranked.push_back(&hotspot);
    }
    size_t excess = hotspots_.size() - target;
    std::nth_element(ranked.begin(), ranked.begin() + (excess - 1), ranked.end(),
                     [](const Hotspot* a, const Hotspot* b) {
                       if (a->hits != b->hits) {
                         return a->hits < b->hits;
                       }
                       return a->lastAccess < b->lastAccess;
                     });

    std::vector<std::string> coldest;
    coldest.reserve(excess);
    for (size_t i = 0; i < excess; ++i) {
      coldest.push_back(ranked[i]->path);
    }
    for (const auto& path : coldest) {
      hotspots_.erase(path);
    }
  }

  WPT_LOG_DEBUG("Hotspot cleanup dropped {} path(s)", before - hotspots_.size());
}

std::vector<Hotspot> MatcherRegistry::topHotspots(size_t count) const {
  std::vector<Hotspot> ranked;
  ranked.reserve(hotspots_.size());
  for (const auto& [_, hotspot] : hotspots_) {
    ranked.push_back(hotspot);
  }
  std::sort(ranked.begin(), ranked.end(), [](const Hotspot& a, const Hotspot& b) {
    if (a.hits != b.hits) {
      return a.hits > b.hits;
    }
    return a.path < b.path;
  });
  if (ranked.size() > count) {
    ranked.resize(count);
  }
  return ranked;
}

size_t MatcherRegistry::preheat(const std::vector<std::string>& paths) {
  std::vector<std::string> targets = paths;
  if (targets.empty()) {
    for (auto& hotspot : topHotspots(PREHEAT_HOTSPOTS)) {
      targets.push_back(std::move(hotspot.path));
    }
  }

  for (const auto& path : targets) {
    std::string key = parseUrl(path).path;
    cache_.set(key, matchUncached(key), routesVersion_);
  }

  preheated_ = true;
  WPT_LOG_DEBUG("Preheated match cache with {} path(s)", targets.size());
  return targets.size();
}

RegistryStats MatcherRegistry::stats() const {
  RegistryStats stats;
  stats.routes = liveRecords_;
  stats.groups = groups_.size();
  for (const auto& group : groups_) {
    stats.trieNodes += group.trie.nodeCount();
  }
  stats.routesVersion = routesVersion_;
  stats.trackedPaths = hotspots_.size();
  stats.preheated = preheated_;
  stats.cache = cache_.stats();
  stats.topHotspots = topHotspots(10);
  return stats;
}

void MatcherRegistry::clear() {
  groups_.clear();
  arena_.assign(1, nullptr);
  patterns_.clear();
  names_.clear();
  children_.clear();
  defaultChildren_.clear();
  liveRecords_ = 0;
  cache_.clear();
  hotspots_.clear();
  preheated_ = false;
  ++routesVersion_;
}

}  // namespace waypoint
