#include "routemap/path-params.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "routemap/path-parameter.hpp"

namespace routemap {

namespace {

constexpr std::size_t kUuidLen = 36;

constexpr bool IsHyphenPos(std::size_t pos) noexcept { return pos == 8U || pos == 13U || pos == 18U || pos == 23U; }

constexpr bool IsHexDigit(char ch) noexcept {
  return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

// Canonical textual form only (8-4-4-4-12), returned lower-cased.
std::optional<std::string> ParseUuid(std::string_view value) {
  if (value.size() != kUuidLen) {
    return std::nullopt;
  }
  std::string uuid(value);
  for (std::size_t pos = 0; pos < kUuidLen; ++pos) {
    char& ch = uuid[pos];
    if (IsHyphenPos(pos)) {
      if (ch != '-') {
        return std::nullopt;
      }
    } else if (!IsHexDigit(ch)) {
      return std::nullopt;
    } else if (ch >= 'A' && ch <= 'F') {
      ch = static_cast<char>(ch - 'A' + 'a');
    }
  }
  return uuid;
}

template <class T>
std::optional<T> ParseNumber(std::string_view value) {
  T result{};
  const char* end = value.data() + value.size();
  const auto [ptr, errc] = std::from_chars(value.data(), end, result);
  if (value.empty() || errc != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return result;
}

std::optional<PathParamValue> ParseValue(ParamType type, std::string_view raw) {
  switch (type) {
    case ParamType::Str:
      [[fallthrough]];
    case ParamType::Path:
      return PathParamValue{std::string(raw)};
    case ParamType::Int:
      if (const auto value = ParseNumber<int64_t>(raw)) {
        return PathParamValue{*value};
      }
      return std::nullopt;
    case ParamType::Float:
      if (const auto value = ParseNumber<double>(raw)) {
        return PathParamValue{*value};
      }
      return std::nullopt;
    case ParamType::Uuid:
      if (auto value = ParseUuid(raw)) {
        return PathParamValue{std::move(*value)};
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

}  // namespace

const PathParamValue* PathParams::find(std::string_view name) const noexcept {
  const auto it = std::ranges::find_if(_params, [name](const PathParam& param) { return param.name == name; });
  return it == _params.end() ? nullptr : &it->value;
}

std::optional<PathParams> ParsePathParams(std::span<const PathParameterDefinition> definitions,
                                          std::span<const std::string_view> rawValues) {
  PathParams params;
  const std::size_t nbParams = std::min(definitions.size(), rawValues.size());
  for (std::size_t paramPos = 0; paramPos < nbParams; ++paramPos) {
    const PathParameterDefinition& definition = definitions[paramPos];
    std::optional<PathParamValue> value = ParseValue(definition.type, rawValues[paramPos]);
    if (!value) {
      return std::nullopt;
    }
    params.emplace(definition.name, std::move(*value));
  }
  return params;
}

}  // namespace routemap
