#pragma once

#include <utility>

#include "urikit/invalid_argument_exception.hpp"

namespace urikit {

// Thrown when a raw string cannot be decomposed into a valid URI reference.
class malformed_uri : public invalid_argument {
 public:
  template <unsigned N>
  explicit malformed_uri(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : invalid_argument(str) {}

  template <typename... Args>
  explicit malformed_uri(fmt::format_string<Args...> fmt, Args&&... args)
      : invalid_argument(fmt, std::forward<Args>(args)...) {}
};

// Thrown when a combination of otherwise valid components breaks a RFC 3986 structural rule,
// for instance a path starting with "//" without an authority.
class invalid_state : public invalid_argument {
 public:
  template <unsigned N>
  explicit invalid_state(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : invalid_argument(str) {}

  template <typename... Args>
  explicit invalid_state(fmt::format_string<Args...> fmt, Args&&... args)
      : invalid_argument(fmt, std::forward<Args>(args)...) {}
};

}  // namespace urikit
