/**
 * @file route_trie.hpp
 * @brief Segment trie with backtracking, specificity-ranked matching
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "location.hpp"
#include "path_compiler.hpp"
#include "route_record.hpp"

namespace waypoint {

/**
 * @brief How specific a pattern is
 *
 * More static segments rank higher; among equal static counts, fewer
 * optional/wildcard ("loose") segments rank higher.
 */
struct Specificity {
  int32_t statics = 0;  ///< Static segments on the path
  int32_t loose = 0;    ///< Optional-parameter and wildcard segments

  bool betterThan(const Specificity& other) const noexcept {
    if (statics != other.statics) {
      return statics > other.statics;
    }
    return loose < other.loose;
  }

  /**
   * @brief Single number for reporting; not used for ranking
   */
  int32_t score() const noexcept { return statics * 100 - loose; }

  bool operator==(const Specificity& other) const = default;
};

/**
 * @brief A record reachable by ending the walk at a node
 */
struct TrieTerminal {
  RecordId id = 0;                      ///< Record stored in the registry arena
  std::vector<std::string> paramNames;  ///< Names for the captured values
  Specificity specificity;              ///< Rank of this terminal
  uint64_t order = 0;                   ///< Registration sequence number
};

/**
 * @brief Node of the route trie
 *
 * Children are keyed by literal segment text; there is at most one
 * parameter child and one wildcard child. Parameter names live on the
 * terminals, so "/a/:id" and "/a/:slug" share nodes.
 */
struct TrieNode {
  std::unordered_map<std::string, std::unique_ptr<TrieNode>> children;
  std::unique_ptr<TrieNode> paramChild;
  std::unique_ptr<TrieNode> wildcardChild;
  std::vector<TrieTerminal> terminals;  ///< Kept in registration order
  Specificity weight;                   ///< Specificity of the path to here

  /**
   * @brief Get literal child for a segment
   * @return Non-owning pointer, or nullptr if no such edge exists
   */
  TrieNode* getChild(const std::string& segment) const noexcept {
    auto it = children.find(segment);
    return it == children.end() ? nullptr : it->second.get();
  }

  bool hasChildren() const noexcept {
    return !children.empty() || paramChild || wildcardChild;
  }

  bool isTerminal() const noexcept { return !terminals.empty(); }
};

/**
 * @brief Outcome of a trie walk
 */
struct TrieMatch {
  RecordId id = 0;
  Params params;
  Specificity specificity;
};

/**
 * @brief Trie of compiled route patterns
 */
class RouteTrie {
 public:
  RouteTrie();

  /**
   * @brief Insert a compiled pattern for a record
   *
   * Re-inserting an id replaces its previous pattern.
   *
   * @param pattern Compiled pattern
   * @param id Record id
   * @param order Registration sequence number, used for tie-breaking
   * @param name Optional route name for matchByName
   */
  void insert(const CompiledPattern& pattern, RecordId id, uint64_t order,
              const std::optional<std::string>& name = std::nullopt);

  /**
   * @brief Remove a record and prune branches left empty
   * @return True if the record was present
   */
  bool remove(RecordId id);

  /**
   * @brief Match decoded path segments
   *
   * Depth-first walk trying the literal edge, then the parameter edge, then
   * the wildcard edge at every node. The most specific complete walk wins;
   * ties go to the first walk found in that order and, on one node, to the
   * earliest registration.
   */
  std::optional<TrieMatch> match(const std::vector<std::string>& segments) const;

  /**
   * @brief Look up a record by route name
   */
  std::optional<RecordId> matchByName(std::string_view name) const;

  bool contains(RecordId id) const { return patterns_.count(id) > 0; }
  size_t size() const noexcept { return patterns_.size(); }
  bool empty() const noexcept { return patterns_.empty(); }

  /**
   * @brief Number of nodes including the root
   */
  size_t nodeCount() const noexcept;

  /**
   * @brief Pattern strings of all stored records
   */
  std::vector<std::string> getAllPatterns() const;

  void clear() noexcept;

 private:
  struct Stored {
    CompiledPattern pattern;
    std::optional<std::string> name;
  };

  struct Best {
    const TrieTerminal* terminal = nullptr;
    std::vector<std::string> values;
  };

  std::unique_ptr<TrieNode> createNode(Specificity weight) const {
    auto node = std::make_unique<TrieNode>();
    node->weight = weight;
    return node;
  }

  void addTerminal(TrieNode* node, TrieTerminal terminal);
  void walk(const TrieNode* node, const std::vector<std::string>& segments,
            size_t index, std::vector<std::string>& values, Best& best) const;
  void consider(const TrieNode* node, const std::vector<std::string>& values,
                Best& best) const;
  bool removeRecursive(TrieNode* node, const std::vector<CompiledSegment>& segments,
                       size_t index, RecordId id);
  size_t countNodes(const TrieNode* node) const noexcept;

  std::unique_ptr<TrieNode> root_;
  std::unordered_map<RecordId, Stored> patterns_;
  std::unordered_map<std::string, RecordId> names_;
};

}  // namespace waypoint
