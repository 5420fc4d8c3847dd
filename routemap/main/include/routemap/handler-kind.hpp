#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "routemap/http-method.hpp"

namespace routemap {

// Key of a handler inside a dispatch handler group: websocket, a standard HTTP method,
// or an HTTP extension method identified by its token.
class HandlerKind {
 public:
  enum class Type : std::uint8_t { Websocket, Method, ExtensionMethod };

  [[nodiscard]] static HandlerKind Websocket() noexcept { return HandlerKind(Type::Websocket); }

  HandlerKind(http::Method method) noexcept  // NOLINT(google-explicit-constructor)
      : _method(method), _type(Type::Method) {}

  // Standard method tokens give a Type::Method kind, any other token a Type::ExtensionMethod one.
  [[nodiscard]] static HandlerKind FromMethodName(std::string_view methodName) {
    if (const auto method = http::MethodFromStr(methodName)) {
      return {*method};
    }
    HandlerKind kind(Type::ExtensionMethod);
    kind._extensionMethod.assign(methodName);
    return kind;
  }

  [[nodiscard]] Type type() const noexcept { return _type; }

  // Only meaningful for Type::Method.
  [[nodiscard]] http::Method method() const noexcept { return _method; }

  // Only meaningful for Type::ExtensionMethod.
  [[nodiscard]] const std::string& extensionMethod() const noexcept { return _extensionMethod; }

  [[nodiscard]] std::string_view name() const noexcept {
    switch (_type) {
      case Type::Websocket:
        return "websocket";
      case Type::Method:
        return http::MethodToStr(_method);
      default:
        return _extensionMethod;
    }
  }

  bool operator==(const HandlerKind&) const noexcept = default;

 private:
  explicit HandlerKind(Type type) noexcept : _type(type) {}

  std::string _extensionMethod;
  http::Method _method{http::Method::GET};
  Type _type;
};

}  // namespace routemap
