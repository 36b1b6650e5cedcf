#pragma once

#include <string>
#include <string_view>

#include "urikit/cctype.hpp"

namespace urikit {

inline constexpr char kAsciiCaseOffset = 'a' - 'A';

// ASCII only case mapping, independent of the locale. Other bytes are returned unchanged.
constexpr char tolower(char ch) noexcept { return isupper(ch) ? static_cast<char>(ch + kAsciiCaseOffset) : ch; }

constexpr char toupper(char ch) noexcept { return islower(ch) ? static_cast<char>(ch - kAsciiCaseOffset) : ch; }

// Returns an ASCII lower-cased copy of 'str' (schemes, hosts).
inline std::string ToLowerStr(std::string_view str) {
  std::string ret;
  ret.reserve(str.size());
  for (char ch : str) {
    ret.push_back(tolower(ch));
  }
  return ret;
}

}  // namespace urikit
