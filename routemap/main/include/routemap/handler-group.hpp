#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "routemap/flat-hash-map.hpp"
#include "routemap/handler-kind.hpp"
#include "routemap/handler.hpp"
#include "routemap/http-method.hpp"
#include "routemap/path-parameter.hpp"
#include "routemap/vector.hpp"

namespace routemap {

// Serves every sub-path below 'path' with a single handler, typically a static file server.
// Static groups never carry path parameters.
struct StaticHandlerGroup {
  std::string path;
  Handler handler;
};

// A single handler serving every method and protocol at its position.
struct CatchallHandlerGroup {
  vector<PathParameterDefinition> pathParameters;
  Handler handler;
};

// Per-method / per-protocol dispatch table.
class DispatchHandlerGroup {
 public:
  DispatchHandlerGroup() noexcept = default;

  explicit DispatchHandlerGroup(vector<PathParameterDefinition> pathParameters) noexcept
      : _pathParameters(std::move(pathParameters)) {}

  [[nodiscard]] std::span<const PathParameterDefinition> pathParameters() const noexcept { return _pathParameters; }

  // Installs handler for given kind. Returns true if it replaced an existing handler.
  bool set(const HandlerKind& kind, Handler handler);

  // Returns the handler registered for given kind, or nullptr.
  [[nodiscard]] const Handler* find(const HandlerKind& kind) const noexcept;

  // Bitmap of the standard HTTP methods having a handler.
  [[nodiscard]] http::MethodBmp methodBmp() const noexcept { return _methodBmp; }

  [[nodiscard]] bool hasExtensionMethods() const noexcept { return !_extensionMethodHandlers.empty(); }

  // Tokens of the extension methods having a handler, sorted.
  [[nodiscard]] vector<std::string_view> extensionMethods() const;

  // Number of registered handlers, all kinds included.
  [[nodiscard]] std::size_t size() const noexcept;

  // Moves all handlers of other into this group, other's handlers replacing same-kind ones.
  // Path parameters of this group are kept. path is only used for logging.
  void absorb(DispatchHandlerGroup&& other, std::string_view path);

 private:
  vector<PathParameterDefinition> _pathParameters;
  std::array<Handler, http::kNbMethods> _methodHandlers{};
  flat_hash_map<std::string, Handler> _extensionMethodHandlers;
  Handler _websocketHandler;
  http::MethodBmp _methodBmp{};
};

// What is reachable at one trie node or plain route entry.
using HandlerGroup = std::variant<StaticHandlerGroup, CatchallHandlerGroup, DispatchHandlerGroup>;

[[nodiscard]] std::span<const PathParameterDefinition> PathParametersOf(const HandlerGroup& group) noexcept;

[[nodiscard]] std::string_view HandlerGroupKindName(const HandlerGroup& group) noexcept;

// Merges incoming into existing, both declared at the same position 'path'.
//  - static + static: existing is kept
//  - static + anything else: conflict
//  - catch-all + catch-all: path parameters must be equal, incoming handler replaces the existing one
//  - catch-all + dispatch: conflict
//  - dispatch + dispatch: path parameters must be equal, handlers are unioned, incoming ones winning
// Throws configuration_conflict, in which case existing is left untouched.
void MergeHandlerGroup(HandlerGroup& existing, HandlerGroup&& incoming, std::string_view path);

}  // namespace routemap
