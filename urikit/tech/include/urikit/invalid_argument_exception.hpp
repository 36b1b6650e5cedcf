#pragma once

#include <utility>

#include "urikit/exception.hpp"

namespace urikit {

class invalid_argument : public exception {
 public:
  template <unsigned N>
  explicit invalid_argument(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <typename... Args>
  explicit invalid_argument(fmt::format_string<Args...> fmt, Args&&... args)
      : exception(fmt, std::forward<Args>(args)...) {}
};

}  // namespace urikit
