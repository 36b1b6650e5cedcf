#pragma once

#include <cstddef>
#include <string_view>

#include "urikit/tolower-str.hpp"

namespace urikit {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

struct CaseInsensitiveHashFunc {
  using is_transparent = void;

  constexpr std::size_t operator()(std::string_view str) const noexcept {
    std::size_t hash = 0;
    const char* beg = str.data();
    const char* end = beg + str.size();
    for (; beg != end; ++beg) {
      hash ^= static_cast<std::size_t>(tolower(*beg)) + static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) + (hash << 6) +
              (hash >> 2);
    }
    return hash;
  }
};

struct CaseInsensitiveEqualFunc {
  using is_transparent = void;

  constexpr bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return CaseInsensitiveEqual(lhs, rhs);
  }
};

}  // namespace urikit
