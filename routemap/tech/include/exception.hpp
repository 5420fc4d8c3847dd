#pragma once

#include <cstddef>
#include <cstring>
#include <exception>
#include <format>
#include <utility>

namespace routemap {

// Base exception of the project.
// The message is stored in an inline buffer, so building, copying and throwing it never allocates.
// Messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 119;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_msg, str, N);
  }

  template <typename... Args>
  explicit exception(std::format_string<Args...> fmt, Args&&... args) {
    const auto res = std::format_to_n(_msg, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    *res.out = '\0';
    if (static_cast<std::size_t>(res.size) > kMsgMaxLen) {
      static constexpr std::size_t kEllipsisLen = 3;
      std::memcpy(_msg + kMsgMaxLen - kEllipsisLen, "...", kEllipsisLen);
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _msg; }

 private:
  char _msg[kMsgMaxLen + 1];
};

}  // namespace routemap
