// routemap umbrella header
//
// Pulls in the public routing API:
//   - RouteMap, its configuration and route declarations
//   - handler groups and handler kinds
//   - path helpers (normalization, path templates, path parameters) and the request Scope
//
// Each re-exported header line is annotated with IWYU pragma: export so that including only
// <routemap/routemap.hpp> satisfies include-cleaner for the symbols it provides.
//
// Usage example:
//    #include <routemap/routemap.hpp>
//    using namespace routemap;
//    int main() {
//      RouteMap routeMap;
//      routeMap.addRoute(RouteDeclaration(RouteKind::Http, "/items/{item_id:int}")
//                            .on(http::Method::GET, [](Scope&) { /* ... */ }));
//      Scope scope{"/items/42", "GET"};
//      auto result = routeMap.resolve(scope);  // result.found(), *scope.pathParams.get<int64_t>("item_id") == 42
//    }
#pragma once

// IWYU pragma: begin_exports
#include "routemap/handler-group.hpp"
#include "routemap/handler-kind.hpp"
#include "routemap/handler.hpp"
#include "routemap/http-method.hpp"
#include "routemap/path-normalize.hpp"
#include "routemap/path-parameter.hpp"
#include "routemap/path-params.hpp"
#include "routemap/path-template.hpp"
#include "routemap/route-declaration.hpp"
#include "routemap/route-map-config.hpp"
#include "routemap/route-map.hpp"
#include "routemap/scope.hpp"
// IWYU pragma: end_exports
