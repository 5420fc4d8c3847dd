#pragma once

#include <string_view>

namespace routemap {

constexpr bool IsAsciiSpace(char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// Trim ASCII whitespace (SP, HTAB, LF, CR, FF, VT) on both sides.
constexpr std::string_view TrimSpaces(std::string_view sv) noexcept {
  auto begin = sv.begin();
  auto end = sv.end();
  while (begin != end && IsAsciiSpace(*begin)) {
    ++begin;
  }
  while (begin != end) {
    --end;
    if (!IsAsciiSpace(*end)) {
      ++end;
      break;
    }
  }
  return {begin, end};
}

}  // namespace routemap
