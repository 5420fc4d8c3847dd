#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

namespace routemap {

enum class ParamType : std::uint8_t { Str, Int, Float, Uuid, Path };

inline constexpr std::string_view kParamTypeNames[] = {"str", "int", "float", "uuid", "path"};

constexpr std::string_view ParamTypeToStr(ParamType type) { return kParamTypeNames[static_cast<std::uint8_t>(type)]; }

constexpr std::optional<ParamType> ParamTypeFromStr(std::string_view name) noexcept {
  for (std::uint8_t idx = 0; idx < std::size(kParamTypeNames); ++idx) {
    if (kParamTypeNames[idx] == name) {
      return static_cast<ParamType>(idx);
    }
  }
  return std::nullopt;
}

// Definition of one path parameter of a route, as produced by ParsePathTemplate.
// The route map only compares definitions for equality and uses 'full' to locate the placeholder
// segment in the route path: a segment is a placeholder when its text, without the surrounding
// delimiters, equals 'full'.
struct PathParameterDefinition {
  bool operator==(const PathParameterDefinition&) const noexcept = default;

  std::string name;  // key of the parsed value, e.g. "id"
  std::string full;  // text between the delimiters in the template, e.g. "id:int"
  ParamType type{ParamType::Str};
};

}  // namespace routemap
