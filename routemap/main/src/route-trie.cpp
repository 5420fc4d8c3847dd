#include "routemap/route-trie.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "exception.hpp"
#include "routemap/handler-group.hpp"
#include "routemap/path-normalize.hpp"
#include "routemap/path-parameter.hpp"

namespace routemap {

RouteTrie::RouteTrie(char paramOpen, char paramClose, std::uint32_t initialNodeCapacity)
    : _initialNodeCapacity(std::max(initialNodeCapacity, std::uint32_t{1})),
      _paramOpen(paramOpen),
      _paramClose(paramClose) {
  clear();
}

void RouteTrie::clear() {
  _nodes.clear();
  _nodes.reserve(_initialNodeCapacity);
  _nodes.emplace_back();
  _nbHandlerGroups = 0;
}

bool RouteTrie::isPlaceholder(std::string_view segment,
                              std::span<const PathParameterDefinition> parameters) const noexcept {
  if (parameters.empty() || segment.size() < 2U || segment.front() != _paramOpen || segment.back() != _paramClose) {
    return false;
  }
  const std::string_view inner = segment.substr(1U, segment.size() - 2U);
  return std::ranges::any_of(parameters, [inner](const PathParameterDefinition& def) { return def.full == inner; });
}

RouteTrie::NodeIdx RouteTrie::newNode() {
  if (_nodes.size() >= static_cast<std::size_t>(kNoNode)) {
    throw exception("Route trie cannot hold more than {} nodes", kNoNode);
  }
  _nodes.emplace_back();
  return static_cast<NodeIdx>(_nodes.size() - 1U);
}

RouteTrie::NodeIdx RouteTrie::literalChild(NodeIdx nodeIdx, std::string_view segment) {
  std::string key(segment);
  const auto it = _nodes[nodeIdx].children.find(key);
  if (it != _nodes[nodeIdx].children.end()) {
    return it->second;
  }
  const NodeIdx childIdx = newNode();
  // newNode may have moved the arena
  _nodes[nodeIdx].children.emplace(std::move(key), childIdx);
  return childIdx;
}

RouteTrie::NodeIdx RouteTrie::placeholderChild(NodeIdx nodeIdx) {
  if (_nodes[nodeIdx].placeholderChild == kNoNode) {
    const NodeIdx childIdx = newNode();
    _nodes[nodeIdx].placeholderChild = childIdx;
  }
  return _nodes[nodeIdx].placeholderChild;
}

void RouteTrie::insert(std::string_view path, std::span<const PathParameterDefinition> parameters,
                       HandlerGroup group) {
  NodeIdx nodeIdx = kRootIdx;
  for (const std::string_view segment : SplitPathSegments(path)) {
    nodeIdx = isPlaceholder(segment, parameters) ? placeholderChild(nodeIdx) : literalChild(nodeIdx, segment);
  }

  Node& node = _nodes[nodeIdx];
  if (!node.handlerGroup) {
    node.handlerGroup.emplace(std::move(group));
    ++_nbHandlerGroups;
  } else {
    MergeHandlerGroup(*node.handlerGroup, std::move(group), path);
  }
}

RouteTrie::Match RouteTrie::find(std::string_view path, PathCaptures& captures) const {
  NodeIdx nodeIdx = kRootIdx;
  // children are keyed by std::string, segments are copied into this buffer for lookup
  std::string key;
  std::size_t pos = 0;
  while (true) {
    while (pos < path.size() && path[pos] == kPathSeparator) {
      ++pos;
    }
    if (pos == path.size()) {
      break;
    }
    const std::size_t endPos = std::min(path.find(kPathSeparator, pos), path.size());
    const Node& node = _nodes[nodeIdx];

    key.assign(path, pos, endPos - pos);
    const auto it = node.children.find(key);
    if (it != node.children.end()) {
      nodeIdx = it->second;
    } else if (node.placeholderChild != kNoNode) {
      captures.push_back(PathCapture{static_cast<std::uint32_t>(pos), static_cast<std::uint32_t>(endPos - pos)});
      nodeIdx = node.placeholderChild;
    } else if (node.isStatic()) {
      return Match{&*node.handlerGroup, true};
    } else {
      return {};
    }
    pos = endPos;
  }
  const Node& node = _nodes[nodeIdx];
  if (node.handlerGroup) {
    return Match{&*node.handlerGroup, false};
  }
  return {};
}

const HandlerGroup* RouteTrie::at(std::string_view path) const {
  NodeIdx nodeIdx = kRootIdx;
  std::string key;
  for (const std::string_view segment : SplitPathSegments(path)) {
    const Node& node = _nodes[nodeIdx];
    key.assign(segment);
    const auto it = node.children.find(key);
    if (it != node.children.end()) {
      nodeIdx = it->second;
    } else if (node.placeholderChild != kNoNode) {
      nodeIdx = node.placeholderChild;
    } else {
      return nullptr;
    }
  }
  const Node& node = _nodes[nodeIdx];
  return node.handlerGroup ? &*node.handlerGroup : nullptr;
}

}  // namespace routemap
