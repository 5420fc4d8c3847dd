#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "routemap/path-template.hpp"
#include "routemap/vector.hpp"

namespace routemap {

struct RouteMapConfig {
  // Throws invalid_argument if the configuration is not usable.
  void validate() const;

  // Delimiters wrapping a path parameter in route paths, as in "/items/{item_id:int}".
  // They must differ from each other and from the path separator, and cannot be whitespace.
  RouteMapConfig& withParamDelimiters(char open, char close) {
    paramOpen = open;
    paramClose = close;
    return *this;
  }

  // Number of trie nodes reserved up front.
  RouteMapConfig& withInitialNodeCapacity(std::uint32_t capacity) {
    initialNodeCapacity = capacity;
    return *this;
  }

  // Registers a static path at route map construction. Path is normalized when registered.
  RouteMapConfig& withStaticPath(std::string_view path) {
    staticPaths.emplace_back(path);
    return *this;
  }

  vector<std::string> staticPaths;

  std::uint32_t initialNodeCapacity{16};

  char paramOpen{kDefaultParamOpen};
  char paramClose{kDefaultParamClose};
};

}  // namespace routemap
