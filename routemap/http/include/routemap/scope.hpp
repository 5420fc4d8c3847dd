#pragma once

#include <cstdint>
#include <string>

#include "routemap/path-params.hpp"

namespace routemap {

enum class ScopeType : std::uint8_t { Http, Websocket };

// Request-time context handed to RouteMap::resolve by the dispatch loop.
// resolve reads path, type and method, rewrites path when a static prefix is stripped
// and always assigns pathParams.
struct Scope {
  std::string path;
  std::string method;  // HTTP method token, unused for websocket scopes
  PathParams pathParams;
  ScopeType type{ScopeType::Http};
};

}  // namespace routemap
