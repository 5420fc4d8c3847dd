#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "routemap/flat-hash-map.hpp"
#include "routemap/handler-group.hpp"
#include "routemap/path-parameter.hpp"
#include "routemap/path-template.hpp"
#include "routemap/vector.hpp"

namespace routemap {

// Position of a captured segment value inside the looked up path.
struct PathCapture {
  std::uint32_t pos;
  std::uint32_t len;
};

using PathCaptures = SmallVector<PathCapture, 8>;

// Segment trie holding the handler groups of parameterized and static routes.
// Nodes live in a flat arena and reference each other by index, so copying is a plain deep copy
// and destruction never recurses, whatever the depth of the trie.
class RouteTrie {
 public:
  using NodeIdx = std::uint32_t;

  static constexpr NodeIdx kRootIdx = 0;
  static constexpr NodeIdx kNoNode = std::numeric_limits<NodeIdx>::max();

  struct Match {
    const HandlerGroup* pHandlerGroup{nullptr};
    // Set when the walk stopped on a static handler group before consuming the whole path.
    bool staticPrefixMatch{false};
  };

  explicit RouteTrie(char paramOpen = kDefaultParamOpen, char paramClose = kDefaultParamClose,
                     std::uint32_t initialNodeCapacity = 16);

  // Installs group at the position of path, creating nodes as needed. A segment is a placeholder when
  // the text between the parameter delimiters equals the 'full' token of one of parameters.
  // If a group already exists at that position, group is merged into it (see MergeHandlerGroup).
  // Throws configuration_conflict if the merge fails.
  // Use at() to reach the stored group, as inserting may reallocate the node arena.
  void insert(std::string_view path, std::span<const PathParameterDefinition> parameters, HandlerGroup group);

  // Looks up a normalized path. Literal children are preferred over the placeholder child, and a static
  // group met on the way is only used when neither matches. There is no backtracking.
  // Placeholder captures are appended to captures.
  [[nodiscard]] Match find(std::string_view path, PathCaptures& captures) const;

  // Returns the handler group stored exactly at the position of path, without static prefix fallback.
  // Placeholders match any segment.
  [[nodiscard]] const HandlerGroup* at(std::string_view path) const;

  void clear();

  [[nodiscard]] std::size_t nbNodes() const noexcept { return _nodes.size(); }

  [[nodiscard]] std::size_t nbHandlerGroups() const noexcept { return _nbHandlerGroups; }

 private:
  struct Node {
    [[nodiscard]] bool isStatic() const noexcept {
      return handlerGroup && std::holds_alternative<StaticHandlerGroup>(*handlerGroup);
    }

    flat_hash_map<std::string, NodeIdx> children;
    std::optional<HandlerGroup> handlerGroup;
    NodeIdx placeholderChild{kNoNode};
  };

  [[nodiscard]] bool isPlaceholder(std::string_view segment,
                                   std::span<const PathParameterDefinition> parameters) const noexcept;

  NodeIdx newNode();

  NodeIdx literalChild(NodeIdx nodeIdx, std::string_view segment);

  NodeIdx placeholderChild(NodeIdx nodeIdx);

  vector<Node> _nodes;
  std::size_t _nbHandlerGroups{};
  std::uint32_t _initialNodeCapacity;
  char _paramOpen;
  char _paramClose;
};

}  // namespace routemap
