#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "routemap/path-parameter.hpp"
#include "routemap/vector.hpp"

namespace routemap {

// Parsed value of a path parameter: text for str, path and uuid, integer for int, double for float.
using PathParamValue = std::variant<std::string, int64_t, double>;

struct PathParam {
  bool operator==(const PathParam&) const = default;

  std::string name;
  PathParamValue value;
};

// Ordered collection of parsed path parameters attached to a Scope after resolution.
class PathParams {
 public:
  using const_iterator = const PathParam*;

  void emplace(std::string name, PathParamValue value) {
    _params.push_back(PathParam{std::move(name), std::move(value)});
  }

  // Returns the value of the parameter with given name, or nullptr if absent.
  [[nodiscard]] const PathParamValue* find(std::string_view name) const noexcept;

  // Returns a pointer to the value of given parameter if it is present and holds a T, nullptr otherwise.
  template <class T>
  [[nodiscard]] const T* get(std::string_view name) const noexcept {
    const PathParamValue* pValue = find(name);
    return pValue == nullptr ? nullptr : std::get_if<T>(pValue);
  }

  [[nodiscard]] std::size_t size() const noexcept { return _params.size(); }

  [[nodiscard]] bool empty() const noexcept { return _params.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _params.data(); }
  [[nodiscard]] const_iterator end() const noexcept { return _params.data() + _params.size(); }

  void clear() noexcept { _params.clear(); }

  bool operator==(const PathParams& other) const { return std::ranges::equal(_params, other._params); }

 private:
  vector<PathParam> _params;
};

// Default path parameter parser: converts the raw segment values captured during lookup, in
// declaration order, according to the type of each definition.
// Returns std::nullopt if a value cannot be converted (non numeric int, malformed uuid, ...).
// Extra raw values beyond the number of definitions are ignored.
[[nodiscard]] std::optional<PathParams> ParsePathParams(std::span<const PathParameterDefinition> definitions,
                                                        std::span<const std::string_view> rawValues);

}  // namespace routemap
