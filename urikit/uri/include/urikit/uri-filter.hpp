#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace urikit {

namespace detail {

// Two 64-bit chunks: [0-63], [64-127]
inline constexpr uint64_t kUnreservedBitmap[2] = {
    (1ULL << '-') | (1ULL << '.') | (0x3FFULL << '0'),  // digits 0-9
    (0x3FFFFFFULL << ('A' - 64)) | (1ULL << ('_' - 64)) | (0x3FFFFFFULL << ('a' - 64)) | (1ULL << ('~' - 64))};

inline constexpr uint64_t kSubDelimsBitmap[2] = {(1ULL << '!') | (1ULL << '$') | (1ULL << '&') | (1ULL << '\'') |
                                                     (1ULL << '(') | (1ULL << ')') | (1ULL << '*') | (1ULL << '+') |
                                                     (1ULL << ',') | (1ULL << ';') | (1ULL << '='),
                                                 0};

constexpr bool InAsciiBitmap(const uint64_t (&bitmap)[2], unsigned char uc) noexcept {
  return uc < 128U && ((bitmap[uc >> 6] >> (uc & 63)) & 1U) != 0U;
}

}  // namespace detail

/// RFC 3986 §2.3: unreserved = ALPHA / DIGIT / "-" / "." / "_" / "~"
constexpr bool IsUriUnreserved(char ch) noexcept {
  return detail::InAsciiBitmap(detail::kUnreservedBitmap, static_cast<unsigned char>(ch));
}

/// RFC 3986 §2.2: sub-delims = "!" / "$" / "&" / "'" / "(" / ")" / "*" / "+" / "," / ";" / "="
constexpr bool IsUriSubDelim(char ch) noexcept {
  return detail::InAsciiBitmap(detail::kSubDelimsBitmap, static_cast<unsigned char>(ch));
}

/// RFC 3986 §3.1: scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
/// The empty string is accepted and means "no scheme".
bool IsValidScheme(std::string_view scheme) noexcept;

// Percent-encodes every byte of 'str' that is neither unreserved, a sub-delim nor part of 'allowedExtra'.
// Already encoded triplets (%XX) are kept as is, so the operation is idempotent. Any other '%' becomes "%25".
std::string PercentEncodeExcept(std::string_view str, std::string_view allowedExtra);

// Lower-cases the scheme. Throws invalid_argument if it does not follow the scheme syntax.
std::string FilterScheme(std::string_view scheme);

// Lower-cases the host. Throws invalid_argument for characters that cannot appear in a host
// (whitespace, '/', '?', '#', '@', and ':', '[', ']' outside of a bracketed IP literal).
std::string FilterHost(std::string_view host);

// Checks that port, if any, is in [1, 65535]. Throws invalid_argument otherwise.
std::optional<uint16_t> FilterPort(std::optional<int> port);

// Encodes a user or password part of the userinfo (unreserved and sub-delims are kept).
std::string FilterUserInfoComponent(std::string_view component);

// Encodes a path (unreserved, sub-delims, ':', '@' and '/' are kept).
std::string FilterPath(std::string_view path);

// Encodes a query or a fragment (unreserved, sub-delims, ':', '@', '/' and '?' are kept).
std::string FilterQueryOrFragment(std::string_view str);

}  // namespace urikit
