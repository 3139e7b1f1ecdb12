#include "waypoint/route_trie.hpp"

#include <algorithm>

namespace waypoint {

RouteTrie::RouteTrie() : root_(createNode(Specificity{})) {}

void RouteTrie::addTerminal(TrieNode* node, TrieTerminal terminal) {
  auto pos = std::upper_bound(
      node->terminals.begin(), node->terminals.end(), terminal.order,
      [](uint64_t order, const TrieTerminal& t) { return order < t.order; });
  node->terminals.insert(pos, std::move(terminal));
}

void RouteTrie::insert(const CompiledPattern& pattern, RecordId id, uint64_t order,
                       const std::optional<std::string>& name) {
  if (contains(id)) {
    remove(id);
  }

  TrieNode* current = root_.get();
  Specificity weight;
  std::vector<std::string> names;

  for (const auto& segment : pattern.segments) {
    switch (segment.kind) {
      case SegmentKind::Static: {
        ++weight.statics;
        TrieNode* child = current->getChild(segment.text);
        if (!child) {
          current->children[segment.text] = createNode(weight);
          child = current->getChild(segment.text);
        }
        current = child;
        break;
      }
      case SegmentKind::OptionalParam:
        // The pattern also ends before the optional segment
        ++weight.loose;
        addTerminal(current, TrieTerminal{id, names, weight, order});
        [[fallthrough]];
      case SegmentKind::Param: {
        if (!current->paramChild) {
          current->paramChild = createNode(weight);
        }
        current = current->paramChild.get();
        names.push_back(segment.text);
        break;
      }
      case SegmentKind::Wildcard: {
        ++weight.loose;
        if (!current->wildcardChild) {
          current->wildcardChild = createNode(weight);
        }
        current = current->wildcardChild.get();
        names.push_back(segment.text);
        break;
      }
    }
  }

  addTerminal(current, TrieTerminal{id, std::move(names), weight, order});

  patterns_[id] = Stored{pattern, name};
  if (name) {
    names_[*name] = id;
  }
}

bool RouteTrie::remove(RecordId id) {
  auto it = patterns_.find(id);
  if (it == patterns_.end()) {
    return false;
  }

  removeRecursive(root_.get(), it->second.pattern.segments, 0, id);

  if (it->second.name) {
    auto nameIt = names_.find(*it->second.name);
    if (nameIt != names_.end() && nameIt->second == id) {
      names_.erase(nameIt);
    }
  }
  patterns_.erase(it);
  return true;
}

bool RouteTrie::removeRecursive(TrieNode* node,
                                const std::vector<CompiledSegment>& segments,
                                size_t index, RecordId id) {
  auto dropTerminals = [id](TrieNode* n) {
    std::erase_if(n->terminals,
                  [id](const TrieTerminal& t) { return t.id == id; });
  };

  if (index == segments.size()) {
    dropTerminals(node);
    return !node->isTerminal() && !node->hasChildren();
  }

  const auto& segment = segments[index];
  switch (segment.kind) {
    case SegmentKind::Static: {
      auto it = node->children.find(segment.text);
      if (it != node->children.end() &&
          removeRecursive(it->second.get(), segments, index + 1, id)) {
        node->children.erase(it);
      }
      break;
    }
    case SegmentKind::OptionalParam:
      dropTerminals(node);
      [[fallthrough]];
    case SegmentKind::Param:
      if (node->paramChild &&
          removeRecursive(node->paramChild.get(), segments, index + 1, id)) {
        node->paramChild.reset();
      }
      break;
    case SegmentKind::Wildcard:
      if (node->wildcardChild &&
          removeRecursive(node->wildcardChild.get(), segments, index + 1, id)) {
        node->wildcardChild.reset();
      }
      break;
  }

  return !node->isTerminal() && !node->hasChildren();
}

std::optional<TrieMatch> RouteTrie::match(
    const std::vector<std::string>& segments) const {
  Best best;
  std::vector<std::string> values;
  values.reserve(segments.size());

  walk(root_.get(), segments, 0, values, best);

  if (!best.terminal) {
    return std::nullopt;
  }

  TrieMatch result;
  result.id = best.terminal->id;
  result.specificity = best.terminal->specificity;
  const auto& names = best.terminal->paramNames;
  for (size_t i = 0; i < names.size() && i < best.values.size(); ++i) {
    result.params[names[i]] = best.values[i];
  }
  return result;
}

void RouteTrie::consider(const TrieNode* node,
                         const std::vector<std::string>& values,
                         Best& best) const {
  for (const auto& terminal : node->terminals) {
    if (!best.terminal || terminal.specificity.betterThan(best.terminal->specificity)) {
      best.terminal = &terminal;
      best.values = values;
    }
  }
}

void RouteTrie::walk(const TrieNode* node, const std::vector<std::string>& segments,
                     size_t index, std::vector<std::string>& values,
                     Best& best) const {
  if (index == segments.size()) {
    consider(node, values, best);
    return;
  }

  // Every remaining segment matching a literal is the best this branch can do
  auto remaining = static_cast<int32_t>(segments.size() - index);
  if (best.terminal &&
      node->weight.statics + remaining < best.terminal->specificity.statics) {
    return;
  }

  const std::string& segment = segments[index];

  if (const TrieNode* child = node->getChild(segment)) {
    walk(child, segments, index + 1, values, best);
  }

  if (node->paramChild) {
    values.push_back(segment);
    walk(node->paramChild.get(), segments, index + 1, values, best);
    values.pop_back();
  }

  if (node->wildcardChild) {
    std::string rest = segment;
    for (size_t i = index + 1; i < segments.size(); ++i) {
      rest += '/';
      rest += segments[i];
    }
    values.push_back(std::move(rest));
    consider(node->wildcardChild.get(), values, best);
    values.pop_back();
  }
}

std::optional<RecordId> RouteTrie::matchByName(std::string_view name) const {
  auto it = names_.find(std::string(name));
  if (it == names_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t RouteTrie::countNodes(const TrieNode* node) const noexcept {
  if (!node) {
    return 0;
  }
  size_t count = 1;
  for (const auto& [_, child] : node->children) {
    count += countNodes(child.get());
  }
  count += countNodes(node->paramChild.get());
  count += countNodes(node->wildcardChild.get());
  return count;
}

size_t RouteTrie::nodeCount() const noexcept { return countNodes(root_.get()); }

std::vector<std::string> RouteTrie::getAllPatterns() const {
  std::vector<std::pair<uint64_t, std::string>> ordered;
  ordered.reserve(patterns_.size());
  for (const auto& [id, stored] : patterns_) {
    ordered.emplace_back(id, stored.pattern.pattern);
  }
  std::sort(ordered.begin(), ordered.end());

  std::vector<std::string> result;
  result.reserve(ordered.size());
  for (auto& entry : ordered) {
    result.push_back(std::move(entry.second));
  }
  return result;
}

void RouteTrie::clear() noexcept {
  root_ = createNode(Specificity{});
  patterns_.clear();
  names_.clear();
}

}  // namespace waypoint
