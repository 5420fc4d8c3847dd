#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "routemap/flat-hash-map.hpp"
#include "routemap/handler-group.hpp"
#include "routemap/handler.hpp"
#include "routemap/http-method.hpp"
#include "routemap/path-parameter.hpp"
#include "routemap/path-params.hpp"
#include "routemap/route-declaration.hpp"
#include "routemap/route-map-config.hpp"
#include "routemap/route-trie.hpp"
#include "routemap/scope.hpp"
#include "routemap/vector.hpp"

namespace routemap {

// Maps request paths to the handlers of the declared routes.
//
// Routes without path parameters and outside of static paths are stored in a plain table keyed by their
// full path. Other routes live in a segment trie where placeholders match any segment and static groups
// serve every sub-path below them.
//
// A RouteMap is built with addRoute / addRoutes from a single thread, then only read: find, resolve,
// traverse and allowedMethods are const, share no mutable state and can be called concurrently.
class RouteMap {
 public:
  // Wraps the handler of a route (middlewares, exception handlers...). Called once per handler at registration.
  using MiddlewareBuilder = std::function<Handler(const RouteDeclaration&, const Handler&)>;

  // Converts the raw captured segment values of a route into typed path parameters.
  // Returns std::nullopt if a value is invalid for its definition.
  using PathParamsParser = std::function<std::optional<PathParams>(std::span<const PathParameterDefinition>,
                                                                   std::span<const std::string_view>)>;

  using ParamValues = SmallVector<std::string_view, 8>;

  class LookupResult {
   public:
    [[nodiscard]] bool found() const noexcept { return _pHandlerGroup != nullptr; }

    [[nodiscard]] const HandlerGroup* handlerGroup() const noexcept { return _pHandlerGroup; }

    // Normalized looked up path.
    [[nodiscard]] std::string_view path() const noexcept { return _path; }

    // Path with the static prefix removed when the match is a static prefix match, path() otherwise.
    [[nodiscard]] std::string_view rewrittenPath() const noexcept {
      return std::string_view(_path).substr(_rewriteOffset);
    }

    [[nodiscard]] bool rewritten() const noexcept { return _rewriteOffset != 0; }

    [[nodiscard]] std::size_t nbParams() const noexcept { return _captures.size(); }

    // Raw value of the idx-th placeholder segment, in path order.
    [[nodiscard]] std::string_view param(std::size_t idx) const noexcept {
      return std::string_view(_path).substr(_captures[idx].pos, _captures[idx].len);
    }

    [[nodiscard]] ParamValues paramValues() const;

   private:
    friend class RouteMap;

    std::string _path;
    PathCaptures _captures;
    const HandlerGroup* _pHandlerGroup{nullptr};
    std::size_t _rewriteOffset{};
  };

  struct ResolveResult {
    enum class Status : std::uint8_t { Found, NotFound, MethodNotAllowed, InvalidPathParameter };

    [[nodiscard]] bool found() const noexcept { return status == Status::Found; }

    const Handler* pHandler{nullptr};
    // Set for every status but NotFound.
    const HandlerGroup* pHandlerGroup{nullptr};
    Status status{Status::NotFound};
  };

  RouteMap();

  // Validates config and registers its static paths. Empty builder / parser select the defaults
  // (identity middleware, ParsePathParams).
  explicit RouteMap(RouteMapConfig config, MiddlewareBuilder middlewareBuilder = {},
                    PathParamsParser pathParamsParser = {});

  // Static paths are normalized. They only influence routes registered after them.
  void addStaticPath(std::string_view path);

  bool removeStaticPath(std::string_view path);

  [[nodiscard]] bool isStaticPath(std::string_view path) const;

  // Registers a route.
  // Throws invalid_argument for incomplete declarations and configuration_conflict when the route
  // cannot be merged with the routes already registered at the same position.
  void addRoute(const RouteDeclaration& declaration);

  // Registers routes in order, stopping at the first failure.
  void addRoutes(std::span<const RouteDeclaration> declarations);

  [[nodiscard]] LookupResult find(std::string_view path) const;

  // Resolves the handler for scope. On success, scope.path is rewritten if a static prefix was matched,
  // and scope.pathParams receives the parsed path parameters.
  // Never throws for unknown paths or methods, they are reported through ResolveResult::status.
  [[nodiscard]] ResolveResult resolve(Scope& scope) const;

  // Returns the handler group stored exactly at the position of path, or nullptr.
  [[nodiscard]] const HandlerGroup* traverse(std::string_view path) const;

  // Standard methods served at path (for the Allow header of 405 responses). 0 if path is not found.
  // Extension methods are not part of the bitmap, see allowedExtensionMethods.
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const;

  // Sorted extension method tokens served at path, to complete the Allow header built from allowedMethods.
  // Empty for static and catch-all groups, which already allow every method, and for unknown paths.
  // Returned views stay valid until the route map is modified.
  [[nodiscard]] vector<std::string_view> allowedExtensionMethods(std::string_view path) const;

  // Number of distinct route positions.
  [[nodiscard]] std::size_t nbRoutes() const noexcept { return _plainRoutes.size() + _trie.nbHandlerGroups(); }

  [[nodiscard]] std::size_t nbNodes() const noexcept { return _trie.nbNodes(); }

  // Removes all routes. Static paths and configuration are kept.
  void clear();

  [[nodiscard]] const RouteMapConfig& config() const noexcept { return _config; }

 private:
  [[nodiscard]] HandlerGroup buildHandlerGroup(const RouteDeclaration& declaration, bool isStatic) const;

  [[nodiscard]] Handler wrap(const RouteDeclaration& declaration, const Handler& handler) const;

  RouteMapConfig _config;
  MiddlewareBuilder _middlewareBuilder;
  PathParamsParser _pathParamsParser;
  RouteTrie _trie;
  flat_hash_map<std::string, HandlerGroup> _plainRoutes;
  flat_hash_set<std::string> _staticPaths;
};

}  // namespace routemap
