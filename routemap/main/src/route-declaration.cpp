#include "routemap/route-declaration.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "invalid_argument_exception.hpp"
#include "routemap/handler.hpp"
#include "routemap/http-method.hpp"
#include "routemap/path-parameter.hpp"
#include "routemap/path-template.hpp"
#include "routemap/vector.hpp"

namespace routemap {

std::string_view RouteKindToStr(RouteKind kind) noexcept {
  switch (kind) {
    case RouteKind::Http:
      return "http";
    case RouteKind::Websocket:
      return "websocket";
    case RouteKind::Catchall:
      return "catch-all";
    default:
      return "unknown";
  }
}

RouteDeclaration::RouteDeclaration(RouteKind kind, std::string_view pathTemplate, char paramOpen, char paramClose)
    : _kind(kind) {
  PathTemplate parsed = ParsePathTemplate(pathTemplate, paramOpen, paramClose);
  _path = std::move(parsed.path);
  _pathParameters = std::move(parsed.parameters);
}

RouteDeclaration::RouteDeclaration(RouteKind kind, std::string path, vector<PathParameterDefinition> pathParameters)
    : _path(std::move(path)), _pathParameters(std::move(pathParameters)), _kind(kind) {}

RouteDeclaration& RouteDeclaration::on(std::string_view method, Handler handler) {
  if (_kind != RouteKind::Http) {
    throw invalid_argument("Method handlers are only valid for http routes, '{}' is a {} route", _path,
                           RouteKindToStr(_kind));
  }
  if (method.empty()) {
    throw invalid_argument("Empty method token for route '{}'", _path);
  }
  if (!handler) {
    throw invalid_argument("Empty {} handler for route '{}'", method, _path);
  }
  _methodHandlers.push_back(MethodHandler{std::string(method), std::move(handler)});
  return *this;
}

RouteDeclaration& RouteDeclaration::on(http::MethodBmp methods, const Handler& handler) {
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    const http::Method method = http::MethodFromIdx(methodIdx);
    if (http::IsMethodSet(methods, method)) {
      on(method, handler);
    }
  }
  return *this;
}

RouteDeclaration& RouteDeclaration::handle(Handler handler) {
  if (_kind == RouteKind::Http) {
    throw invalid_argument("Http route '{}' needs method handlers, use on()", _path);
  }
  if (!handler) {
    throw invalid_argument("Empty handler for route '{}'", _path);
  }
  _handler = std::move(handler);
  return *this;
}

}  // namespace routemap
