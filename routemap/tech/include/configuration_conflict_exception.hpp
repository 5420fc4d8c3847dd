#pragma once

#include <format>
#include <utility>

#include "exception.hpp"

namespace routemap {

// Thrown at build time when a route declaration cannot coexist with the routes already registered
// at the same position (static / non-static clash, catch-all / method clash, mismatched path parameters).
class configuration_conflict : public exception {
 public:
  template <unsigned N>
  explicit configuration_conflict(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <typename... Args>
  explicit configuration_conflict(std::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace routemap
