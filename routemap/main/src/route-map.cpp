#include "routemap/route-map.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "configuration_conflict_exception.hpp"
#include "invalid_argument_exception.hpp"
#include "log.hpp"
#include "routemap/handler-group.hpp"
#include "routemap/handler-kind.hpp"
#include "routemap/handler.hpp"
#include "routemap/http-method.hpp"
#include "routemap/path-normalize.hpp"
#include "routemap/path-params.hpp"
#include "routemap/route-declaration.hpp"
#include "routemap/route-map-config.hpp"
#include "routemap/scope.hpp"
#include "routemap/vector.hpp"

namespace routemap {

namespace {

RouteMapConfig Validated(RouteMapConfig config) {
  config.validate();
  return config;
}

vector<PathParameterDefinition> CopyParameters(std::span<const PathParameterDefinition> parameters) {
  return vector<PathParameterDefinition>(parameters.data(), parameters.data() + parameters.size());
}

}  // namespace

RouteMap::ParamValues RouteMap::LookupResult::paramValues() const {
  ParamValues values;
  for (std::size_t idx = 0; idx < _captures.size(); ++idx) {
    values.push_back(param(idx));
  }
  return values;
}

RouteMap::RouteMap() : RouteMap(RouteMapConfig{}) {}

RouteMap::RouteMap(RouteMapConfig config, MiddlewareBuilder middlewareBuilder, PathParamsParser pathParamsParser)
    : _config(Validated(std::move(config))),
      _middlewareBuilder(std::move(middlewareBuilder)),
      _pathParamsParser(pathParamsParser ? std::move(pathParamsParser) : PathParamsParser(&ParsePathParams)),
      _trie(_config.paramOpen, _config.paramClose, _config.initialNodeCapacity) {
  for (const std::string& staticPath : _config.staticPaths) {
    addStaticPath(staticPath);
  }
}

void RouteMap::addStaticPath(std::string_view path) { _staticPaths.insert(NormalizePath(path)); }

bool RouteMap::removeStaticPath(std::string_view path) {
  const auto it = _staticPaths.find(NormalizePath(path));
  if (it == _staticPaths.end()) {
    return false;
  }
  _staticPaths.erase(it);
  return true;
}

bool RouteMap::isStaticPath(std::string_view path) const {
  return _staticPaths.find(NormalizePath(path)) != _staticPaths.end();
}

Handler RouteMap::wrap(const RouteDeclaration& declaration, const Handler& handler) const {
  if (!_middlewareBuilder) {
    return handler;
  }
  Handler wrapped = _middlewareBuilder(declaration, handler);
  if (!wrapped) {
    throw invalid_argument("Middleware builder returned an empty handler for route '{}'", declaration.path());
  }
  return wrapped;
}

HandlerGroup RouteMap::buildHandlerGroup(const RouteDeclaration& declaration, bool isStatic) const {
  const std::span<const PathParameterDefinition> parameters = declaration.pathParameters();
  const std::string_view path = declaration.path();

  if (isStatic) {
    if (declaration.kind() != RouteKind::Catchall || !parameters.empty()) {
      log::error("Static path '{}' only accepts a catch-all handler without path parameters", path);
      throw configuration_conflict("Static path '{}' only accepts a catch-all handler without path parameters",
                                   path);
    }
  }

  switch (declaration.kind()) {
    case RouteKind::Http: {
      if (declaration.methodHandlers().empty()) {
        throw invalid_argument("Http route '{}' has no method handler", path);
      }
      DispatchHandlerGroup group(CopyParameters(parameters));
      for (const RouteDeclaration::MethodHandler& methodHandler : declaration.methodHandlers()) {
        const HandlerKind kind = HandlerKind::FromMethodName(methodHandler.method);
        if (group.set(kind, wrap(declaration, methodHandler.handler))) {
          log::warn("Method {} declared twice for route '{}', keeping the last handler", kind.name(), path);
        }
      }
      return group;
    }
    case RouteKind::Websocket: {
      if (!declaration.handler()) {
        throw invalid_argument("Websocket route '{}' has no handler", path);
      }
      DispatchHandlerGroup group(CopyParameters(parameters));
      group.set(HandlerKind::Websocket(), wrap(declaration, declaration.handler()));
      return group;
    }
    case RouteKind::Catchall: {
      if (!declaration.handler()) {
        throw invalid_argument("Catch-all route '{}' has no handler", path);
      }
      Handler handler = wrap(declaration, declaration.handler());
      if (isStatic) {
        return StaticHandlerGroup{NormalizePath(path), std::move(handler)};
      }
      return CatchallHandlerGroup{CopyParameters(parameters), std::move(handler)};
    }
    default:
      throw invalid_argument("Unknown route kind {} for route '{}'", static_cast<int>(declaration.kind()), path);
  }
}

void RouteMap::addRoute(const RouteDeclaration& declaration) {
  std::string path = NormalizePath(declaration.path());
  const bool isStatic = _staticPaths.find(path) != _staticPaths.end();
  HandlerGroup group = buildHandlerGroup(declaration, isStatic);
  const std::span<const PathParameterDefinition> parameters = declaration.pathParameters();

  if (!parameters.empty() || isStatic) {
    log::debug("Registering {} route '{}' ({} handler group) in route trie", RouteKindToStr(declaration.kind()), path,
               HandlerGroupKindName(group));
    _trie.insert(path, parameters, std::move(group));
    return;
  }

  log::debug("Registering {} route '{}' ({} handler group) as plain route", RouteKindToStr(declaration.kind()), path,
             HandlerGroupKindName(group));
  const auto it = _plainRoutes.find(path);
  if (it == _plainRoutes.end()) {
    _plainRoutes.emplace(std::move(path), std::move(group));
  } else {
    MergeHandlerGroup(it->second, std::move(group), path);
  }
}

void RouteMap::addRoutes(std::span<const RouteDeclaration> declarations) {
  for (const RouteDeclaration& declaration : declarations) {
    addRoute(declaration);
  }
}

RouteMap::LookupResult RouteMap::find(std::string_view path) const {
  LookupResult result;
  result._path = NormalizePath(path);

  if (const auto it = _plainRoutes.find(result._path); it != _plainRoutes.end()) {
    result._pHandlerGroup = &it->second;
    return result;
  }

  const RouteTrie::Match match = _trie.find(result._path, result._captures);
  if (match.pHandlerGroup == nullptr) {
    result._captures.clear();
    return result;
  }
  result._pHandlerGroup = match.pHandlerGroup;
  if (match.staticPrefixMatch) {
    const std::string& staticPath = std::get<StaticHandlerGroup>(*match.pHandlerGroup).path;
    if (staticPath.size() > 1U) {
      result._rewriteOffset = staticPath.size();
    }
  }
  return result;
}

RouteMap::ResolveResult RouteMap::resolve(Scope& scope) const {
  ResolveResult result;
  LookupResult lookup = find(scope.path);
  if (!lookup.found()) {
    log::trace("No route for path '{}'", scope.path);
    scope.pathParams.clear();
    return result;
  }
  const HandlerGroup& group = *lookup.handlerGroup();
  result.pHandlerGroup = &group;

  if (lookup.rewritten()) {
    scope.path.assign(lookup.rewrittenPath());
  }

  const ParamValues rawValues = lookup.paramValues();
  std::optional<PathParams> pathParams =
      _pathParamsParser(PathParametersOf(group), std::span<const std::string_view>(rawValues.data(), rawValues.size()));
  if (!pathParams) {
    log::trace("Invalid path parameters for path '{}'", lookup.path());
    scope.pathParams.clear();
    result.status = ResolveResult::Status::InvalidPathParameter;
    return result;
  }
  scope.pathParams = std::move(*pathParams);

  std::visit(
      [&result, &scope](const auto& alternative) {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, DispatchHandlerGroup>) {
          if (scope.type == ScopeType::Http) {
            result.pHandler = alternative.find(HandlerKind::FromMethodName(scope.method));
            result.status =
                result.pHandler == nullptr ? ResolveResult::Status::MethodNotAllowed : ResolveResult::Status::Found;
          } else {
            result.pHandler = alternative.find(HandlerKind::Websocket());
            result.status =
                result.pHandler == nullptr ? ResolveResult::Status::NotFound : ResolveResult::Status::Found;
          }
        } else {
          result.pHandler = &alternative.handler;
          result.status = ResolveResult::Status::Found;
        }
      },
      group);
  return result;
}

const HandlerGroup* RouteMap::traverse(std::string_view path) const {
  const std::string normalizedPath = NormalizePath(path);
  if (const auto it = _plainRoutes.find(normalizedPath); it != _plainRoutes.end()) {
    return &it->second;
  }
  return _trie.at(normalizedPath);
}

http::MethodBmp RouteMap::allowedMethods(std::string_view path) const {
  const LookupResult lookup = find(path);
  if (!lookup.found()) {
    return 0;
  }
  const auto* pDispatch = std::get_if<DispatchHandlerGroup>(lookup.handlerGroup());
  return pDispatch == nullptr ? http::kAllMethodsBmp : pDispatch->methodBmp();
}

vector<std::string_view> RouteMap::allowedExtensionMethods(std::string_view path) const {
  const LookupResult lookup = find(path);
  if (!lookup.found()) {
    return {};
  }
  const auto* pDispatch = std::get_if<DispatchHandlerGroup>(lookup.handlerGroup());
  return pDispatch == nullptr ? vector<std::string_view>{} : pDispatch->extensionMethods();
}

void RouteMap::clear() {
  _trie.clear();
  _plainRoutes.clear();
}

}  // namespace routemap
