#pragma once

#include <functional>

#include "routemap/scope.hpp"

namespace routemap {

// Application entry point stored by the route map and returned by RouteMap::resolve.
// The route map never invokes handlers, it only stores and hands them back.
using Handler = std::function<void(Scope&)>;

}  // namespace routemap
