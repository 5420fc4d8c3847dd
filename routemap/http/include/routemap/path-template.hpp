#pragma once

#include <string>
#include <string_view>

#include "routemap/path-parameter.hpp"
#include "routemap/vector.hpp"

namespace routemap {

inline constexpr char kDefaultParamOpen = '{';
inline constexpr char kDefaultParamClose = '}';

struct PathTemplate {
  std::string path;                              // normalized path, placeholders kept verbatim
  vector<PathParameterDefinition> parameters;    // in order of appearance
};

// Parses a route path template such as "/users/{user_id:int}/files/{name:str}".
// A segment entirely wrapped in the delimiters declares a parameter, which must be written
// 'name:type' with a non-empty name and a type among str, int, float, uuid and path.
// Whitespace around name and type is ignored. Segments only partially wrapped are literals.
// Throws invalid_argument on malformed parameters and on duplicated parameter names.
[[nodiscard]] PathTemplate ParsePathTemplate(std::string_view pathTemplate, char paramOpen = kDefaultParamOpen,
                                             char paramClose = kDefaultParamClose);

}  // namespace routemap
