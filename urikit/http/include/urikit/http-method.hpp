#pragma once

#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <type_traits>

namespace urikit::http {

enum class Method : uint8_t { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH };

using MethodIdx = std::underlying_type_t<Method>;
inline constexpr MethodIdx kNbMethods = 9;

inline constexpr std::string_view kMethodStrings[] = {"GET",     "HEAD",    "POST",  "PUT",  "DELETE",
                                                      "CONNECT", "OPTIONS", "TRACE", "PATCH"};

static_assert(std::size(kMethodStrings) == kNbMethods);

constexpr std::string_view MethodToStr(Method method) { return kMethodStrings[static_cast<MethodIdx>(method)]; }

// Attempt to parse a HTTP method.
// RFC 9110 §9.1: The method token is case-sensitive, BUT:
// RFC 9110 §2.5. The RFC encourages robustness:
// "Although methods are case-sensitive, the implementation SHOULD be case-insensitive when parsing received messages."
std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace urikit::http
