#pragma once

#include <string>
#include <string_view>

#include "routemap/vector.hpp"

namespace routemap {

inline constexpr char kPathSeparator = '/';

// Segments of a path, as views into the split path.
using PathSegments = SmallVector<std::string_view, 16>;

// Returns the canonical form of a request or route path:
//   - surrounding whitespace is trimmed, an empty result becomes "/"
//   - runs of consecutive separators are collapsed into one
//   - a single trailing separator is removed, unless the path is the root "/"
//   - a leading separator is added if missing
// NormalizePath(NormalizePath(p)) == NormalizePath(p).
[[nodiscard]] std::string NormalizePath(std::string_view path);

// Tells whether NormalizePath(path) would return path unchanged.
[[nodiscard]] bool IsNormalizedPath(std::string_view path) noexcept;

// Splits path into its non-empty segments, in order. "/" yields no segment.
// Returned views point into path.
[[nodiscard]] PathSegments SplitPathSegments(std::string_view path);

}  // namespace routemap
