#include <routemap/routemap.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "log.hpp"
#include "routemap/vector.hpp"

using namespace routemap;

namespace {

void PrintParams(const Scope &scope) {
  for (const PathParam &param : scope.pathParams) {
    std::cout << "  " << param.name << " = ";
    std::visit([](const auto &value) { std::cout << value; }, param.value);
    std::cout << '\n';
  }
}

}  // namespace

// Usage: routemap-minimal [-v] [METHOD PATH]...
// Resolves each METHOD PATH pair against a small set of routes and calls the matching handler.
int main(int argc, char **argv) {
  int argIdx = 1;
  if (argc > 1 && std::string_view(argv[1]) == "-v") {
    log::set_level(log::level::debug);
    ++argIdx;
  }

  try {
    RouteMap routeMap(RouteMapConfig{}.withStaticPath("/static"));

    routeMap.addRoute(RouteDeclaration(RouteKind::Http, "/")
                          .on(http::Method::GET, [](Scope &) { std::cout << "  -> home page\n"; }));
    routeMap.addRoute(RouteDeclaration(RouteKind::Http, "/users/{user_id:int}")
                          .on(http::Method::GET, [](Scope &) { std::cout << "  -> show user\n"; })
                          .on(http::Method::DELETE, [](Scope &) { std::cout << "  -> delete user\n"; }));
    routeMap.addRoute(RouteDeclaration(RouteKind::Websocket, "/chat/{room:str}").handle([](Scope &) {
      std::cout << "  -> chat room socket\n";
    }));
    routeMap.addRoute(RouteDeclaration(RouteKind::Catchall, "/static").handle([](Scope &scope) {
      std::cout << "  -> serving file " << scope.path << '\n';
    }));

    vector<std::pair<std::string_view, std::string_view>> requests;
    for (; argIdx + 1 < argc; argIdx += 2) {
      requests.emplace_back(argv[argIdx], argv[argIdx + 1]);
    }
    if (requests.empty()) {
      requests.emplace_back("GET", "/");
      requests.emplace_back("GET", "/users/42");
      requests.emplace_back("PUT", "/users/42");
      requests.emplace_back("GET", "/users/abc");
      requests.emplace_back("GET", "/static/css/site.css");
      requests.emplace_back("WEBSOCKET", "/chat/general");
      requests.emplace_back("GET", "/missing");
    }

    for (const auto &[method, path] : requests) {
      Scope scope{std::string(path), std::string(method), {}, ScopeType::Http};
      if (method == "WEBSOCKET") {
        scope.type = ScopeType::Websocket;
        scope.method.clear();
      }
      std::cout << method << ' ' << scope.path << '\n';

      const auto result = routeMap.resolve(scope);
      switch (result.status) {
        case RouteMap::ResolveResult::Status::Found:
          PrintParams(scope);
          (*result.pHandler)(scope);
          break;
        case RouteMap::ResolveResult::Status::MethodNotAllowed: {
          std::cout << "  405 Method Not Allowed, Allow:";
          const http::MethodBmp allowed = routeMap.allowedMethods(scope.path);
          for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
            if (http::IsMethodSet(allowed, http::MethodFromIdx(methodIdx))) {
              std::cout << ' ' << http::kMethodStrings[methodIdx];
            }
          }
          for (std::string_view extensionMethod : routeMap.allowedExtensionMethods(scope.path)) {
            std::cout << ' ' << extensionMethod;
          }
          std::cout << '\n';
          break;
        }
        case RouteMap::ResolveResult::Status::InvalidPathParameter:
          std::cout << "  400 Bad Request (invalid path parameter)\n";
          break;
        default:
          std::cout << "  404 Not Found\n";
          break;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Route configuration error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
