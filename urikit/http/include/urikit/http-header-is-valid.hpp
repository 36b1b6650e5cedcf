#pragma once

#include <algorithm>
#include <string_view>

#include "urikit/tchars.hpp"

namespace urikit::http {

// RFC 7230 §3.2.6: a header name is a non empty token.
constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  return !name.empty() && std::ranges::all_of(name, [](char ch) { return is_tchar(ch); });
}

// RFC 7230 §3.2: field-value is made of HTAB, SP, VCHAR and obs-text. CR, LF and other controls are rejected.
// The empty value is allowed.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  return std::ranges::all_of(value, [](char ch) {
    const auto uc = static_cast<unsigned char>(ch);
    return uc == '\t' || (uc >= 0x20 && uc != 0x7F);
  });
}

}  // namespace urikit::http
