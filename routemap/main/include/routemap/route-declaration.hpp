#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "routemap/handler.hpp"
#include "routemap/http-method.hpp"
#include "routemap/path-parameter.hpp"
#include "routemap/path-template.hpp"
#include "routemap/vector.hpp"

namespace routemap {

enum class RouteKind : std::uint8_t { Http, Websocket, Catchall };

[[nodiscard]] std::string_view RouteKindToStr(RouteKind kind) noexcept;

// Build time description of a route: a path template, its path parameter definitions and its handlers.
// HTTP routes carry method -> handler pairs (see on()), websocket and catch-all routes a single handler
// (see handle()).
class RouteDeclaration {
 public:
  struct MethodHandler {
    std::string method;
    Handler handler;
  };

  // Parses pathTemplate with ParsePathTemplate. Throws invalid_argument if it is malformed.
  RouteDeclaration(RouteKind kind, std::string_view pathTemplate, char paramOpen = kDefaultParamOpen,
                   char paramClose = kDefaultParamClose);

  // Declares a route from an already parsed path and its parameter definitions.
  // 'full' of each definition is the text found between the parameter delimiters in the path.
  RouteDeclaration(RouteKind kind, std::string path, vector<PathParameterDefinition> pathParameters);

  // Registers handler for given method token. Only valid for HTTP routes (invalid_argument otherwise).
  RouteDeclaration& on(std::string_view method, Handler handler);

  RouteDeclaration& on(http::Method method, Handler handler) {
    return on(http::MethodToStr(method), std::move(handler));
  }

  // Registers a copy of handler for each method set in methods.
  RouteDeclaration& on(http::MethodBmp methods, const Handler& handler);

  // Sets the single handler of a websocket or catch-all route (invalid_argument for HTTP routes).
  RouteDeclaration& handle(Handler handler);

  [[nodiscard]] RouteKind kind() const noexcept { return _kind; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] std::span<const PathParameterDefinition> pathParameters() const noexcept { return _pathParameters; }

  [[nodiscard]] std::span<const MethodHandler> methodHandlers() const noexcept { return _methodHandlers; }

  [[nodiscard]] const Handler& handler() const noexcept { return _handler; }

 private:
  std::string _path;
  vector<PathParameterDefinition> _pathParameters;
  vector<MethodHandler> _methodHandlers;
  Handler _handler;
  RouteKind _kind;
};

}  // namespace routemap
