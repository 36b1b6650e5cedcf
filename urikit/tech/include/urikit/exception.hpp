#pragma once

#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <cstring>
#include <exception>
#include <string_view>
#include <utility>

namespace urikit {

// Base exception of urikit.
// The message lives in inline storage so that throwing never allocates for the string part.
// Formatted messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data.data(), str, N);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmt, Args&&... args) {
    const auto res = fmt::format_to_n(_data.data(), kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      static constexpr std::string_view kEllipsis = "...";
      std::memcpy(_data.data() + kMsgMaxLen - kEllipsis.size(), kEllipsis.data(), kEllipsis.size());
    }
    *res.out = '\0';
  }

  [[nodiscard]] const char* what() const noexcept override { return _data.data(); }

 private:
  std::array<char, kMsgMaxLen + 1> _data;
};

}  // namespace urikit
