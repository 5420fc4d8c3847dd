#include "routemap/handler-group.hpp"

#include <algorithm>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "configuration_conflict_exception.hpp"
#include "log.hpp"
#include "routemap/handler-kind.hpp"
#include "routemap/http-method.hpp"
#include "routemap/path-parameter.hpp"
#include "routemap/vector.hpp"

namespace routemap {

namespace {

std::span<const PathParameterDefinition> ParametersOf(const CatchallHandlerGroup& group) noexcept {
  return group.pathParameters;
}

std::span<const PathParameterDefinition> ParametersOf(const DispatchHandlerGroup& group) noexcept {
  return group.pathParameters();
}

}  // namespace

bool DispatchHandlerGroup::set(const HandlerKind& kind, Handler handler) {
  Handler* pSlot;
  switch (kind.type()) {
    case HandlerKind::Type::Websocket:
      pSlot = &_websocketHandler;
      break;
    case HandlerKind::Type::Method:
      pSlot = &_methodHandlers[http::MethodToIdx(kind.method())];
      _methodBmp = _methodBmp | kind.method();
      break;
    default:
      pSlot = &_extensionMethodHandlers[kind.extensionMethod()];
      break;
  }
  const bool overwritten = static_cast<bool>(*pSlot);
  *pSlot = std::move(handler);
  return overwritten;
}

const Handler* DispatchHandlerGroup::find(const HandlerKind& kind) const noexcept {
  const Handler* pHandler;
  switch (kind.type()) {
    case HandlerKind::Type::Websocket:
      pHandler = &_websocketHandler;
      break;
    case HandlerKind::Type::Method:
      pHandler = &_methodHandlers[http::MethodToIdx(kind.method())];
      break;
    default: {
      const auto it = _extensionMethodHandlers.find(kind.extensionMethod());
      if (it == _extensionMethodHandlers.end()) {
        return nullptr;
      }
      pHandler = &it->second;
      break;
    }
  }
  return *pHandler ? pHandler : nullptr;
}

vector<std::string_view> DispatchHandlerGroup::extensionMethods() const {
  vector<std::string_view> methods;
  methods.reserve(static_cast<vector<std::string_view>::size_type>(_extensionMethodHandlers.size()));
  for (const auto& [methodName, handler] : _extensionMethodHandlers) {
    methods.emplace_back(methodName);
  }
  std::ranges::sort(methods);
  return methods;
}

std::size_t DispatchHandlerGroup::size() const noexcept {
  std::size_t nbHandlers = _extensionMethodHandlers.size();
  nbHandlers += static_cast<std::size_t>(std::ranges::count_if(
      _methodHandlers, [](const Handler& handler) { return static_cast<bool>(handler); }));
  if (_websocketHandler) {
    ++nbHandlers;
  }
  return nbHandlers;
}

void DispatchHandlerGroup::absorb(DispatchHandlerGroup&& other, std::string_view path) {
  const auto install = [this, path](const HandlerKind& kind, Handler& handler) {
    if (set(kind, std::move(handler))) {
      log::warn("Overwriting existing {} handler for path '{}'", kind.name(), path);
    }
  };
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    Handler& handler = other._methodHandlers[methodIdx];
    if (handler) {
      install(http::MethodFromIdx(methodIdx), handler);
    }
  }
  for (auto& [methodName, handler] : other._extensionMethodHandlers) {
    install(HandlerKind::FromMethodName(methodName), handler);
  }
  if (other._websocketHandler) {
    install(HandlerKind::Websocket(), other._websocketHandler);
  }
  other._extensionMethodHandlers.clear();
  other._methodBmp = 0;
}

std::span<const PathParameterDefinition> PathParametersOf(const HandlerGroup& group) noexcept {
  return std::visit(
      [](const auto& alternative) -> std::span<const PathParameterDefinition> {
        using T = std::decay_t<decltype(alternative)>;
        if constexpr (std::is_same_v<T, StaticHandlerGroup>) {
          return {};
        } else {
          return ParametersOf(alternative);
        }
      },
      group);
}

std::string_view HandlerGroupKindName(const HandlerGroup& group) noexcept {
  static constexpr std::string_view kNames[] = {"static", "catch-all", "dispatch"};
  return kNames[group.index()];
}

void MergeHandlerGroup(HandlerGroup& existing, HandlerGroup&& incoming, std::string_view path) {
  std::visit(
      [path](auto& current, auto& added) {
        using Current = std::decay_t<decltype(current)>;
        using Added = std::decay_t<decltype(added)>;
        if constexpr (std::is_same_v<Current, StaticHandlerGroup> && std::is_same_v<Added, StaticHandlerGroup>) {
          log::debug("Static path '{}' declared again, keeping the existing handler", path);
        } else if constexpr (std::is_same_v<Current, StaticHandlerGroup> || std::is_same_v<Added, StaticHandlerGroup>) {
          log::error("Cannot have configured routes below a static path, conflict at '{}'", path);
          throw configuration_conflict("Cannot have configured routes below a static path, conflict at '{}'", path);
        } else if constexpr (std::is_same_v<Current, Added>) {
          if (!std::ranges::equal(ParametersOf(current), ParametersOf(added))) {
            log::error("Conflicting path parameters for path '{}'", path);
            throw configuration_conflict("Conflicting path parameters for path '{}'", path);
          }
          if constexpr (std::is_same_v<Current, CatchallHandlerGroup>) {
            log::warn("Overwriting existing catch-all handler for path '{}'", path);
            current.handler = std::move(added.handler);
          } else {
            current.absorb(std::move(added), path);
          }
        } else {
          log::error("Catch-all handler cannot coexist with method handlers at '{}'", path);
          throw configuration_conflict("Catch-all handler cannot coexist with method handlers at '{}'", path);
        }
      },
      existing, incoming);
}

}  // namespace routemap
