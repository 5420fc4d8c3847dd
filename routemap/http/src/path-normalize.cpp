#include "routemap/path-normalize.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "routemap/string-trim.hpp"

namespace routemap {

std::string NormalizePath(std::string_view path) {
  path = TrimSpaces(path);

  std::string normalized;
  normalized.reserve(path.size() + 1U);
  normalized.push_back(kPathSeparator);

  for (const char ch : path) {
    if (ch != kPathSeparator || normalized.back() != kPathSeparator) {
      normalized.push_back(ch);
    }
  }

  if (normalized.size() > 1U && normalized.back() == kPathSeparator) {
    normalized.pop_back();
  }
  return normalized;
}

bool IsNormalizedPath(std::string_view path) noexcept {
  if (path.empty() || path.front() != kPathSeparator) {
    return false;
  }
  if (path.size() == 1U) {
    return true;
  }
  if (path.back() == kPathSeparator || IsAsciiSpace(path.back())) {
    return false;
  }
  return !path.contains("//");
}

PathSegments SplitPathSegments(std::string_view path) {
  PathSegments segments;

  std::size_t pos = 0;
  while (pos < path.size()) {
    const std::size_t nextSlash = path.find(kPathSeparator, pos);
    const std::size_t segmentEnd = nextSlash == std::string_view::npos ? path.size() : nextSlash;
    if (segmentEnd != pos) {
      segments.push_back(path.substr(pos, segmentEnd - pos));
    }
    pos = segmentEnd + 1U;
  }
  return segments;
}

}  // namespace routemap
