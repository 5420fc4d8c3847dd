#include "routemap/path-template.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "invalid_argument_exception.hpp"
#include "routemap/path-normalize.hpp"
#include "routemap/path-parameter.hpp"
#include "routemap/string-trim.hpp"

namespace routemap {

PathTemplate ParsePathTemplate(std::string_view pathTemplate, char paramOpen, char paramClose) {
  PathTemplate result;
  result.path = NormalizePath(pathTemplate);

  for (const std::string_view segment : SplitPathSegments(result.path)) {
    if (segment.size() < 2U || segment.front() != paramOpen || segment.back() != paramClose) {
      continue;
    }

    const std::string_view full = segment.substr(1U, segment.size() - 2U);
    const std::size_t colonPos = full.find(':');
    if (colonPos == std::string_view::npos || full.find(':', colonPos + 1U) != std::string_view::npos) {
      throw invalid_argument("Path parameters should be declared as 'name:type' in path '{}'", result.path);
    }

    const std::string_view name = TrimSpaces(full.substr(0, colonPos));
    if (name.empty()) {
      throw invalid_argument("Path parameter names should not be empty in path '{}'", result.path);
    }

    const std::string_view typeName = TrimSpaces(full.substr(colonPos + 1U));
    const std::optional<ParamType> type = ParamTypeFromStr(typeName);
    if (!type) {
      throw invalid_argument("Unknown path parameter type '{}' in path '{}' (allowed: str, int, float, uuid, path)",
                             typeName, result.path);
    }

    if (std::ranges::any_of(result.parameters,
                            [name](const PathParameterDefinition& def) { return def.name == name; })) {
      throw invalid_argument("Duplicate path parameter '{}' in path '{}'", name, result.path);
    }

    result.parameters.push_back(PathParameterDefinition{std::string(name), std::string(full), *type});
  }

  return result;
}

}  // namespace routemap
