#include "urikit/uri-filter.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "urikit/cctype.hpp"
#include "urikit/invalid_argument_exception.hpp"
#include "urikit/tolower-str.hpp"
#include "urikit/url-encode.hpp"

namespace urikit {

namespace {

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

constexpr std::string_view kPathExtraChars = ":@/";
constexpr std::string_view kQueryOrFragmentExtraChars = ":@/?";

constexpr bool IsSchemeChar(char ch) noexcept { return isalnum(ch) || ch == '+' || ch == '-' || ch == '.'; }

}  // namespace

bool IsValidScheme(std::string_view scheme) noexcept {
  if (scheme.empty()) {
    return true;
  }
  return isalpha(scheme.front()) && std::ranges::all_of(scheme.substr(1), [](char ch) { return IsSchemeChar(ch); });
}

std::string PercentEncodeExcept(std::string_view str, std::string_view allowedExtra) {
  const auto isNotEncoded = [allowedExtra](char ch) {
    return IsUriUnreserved(ch) || IsUriSubDelim(ch) || allowedExtra.find(ch) != std::string_view::npos;
  };
  std::string ret;
  ret.resize(URLEncodedSizeKeepingEscapes(str, isNotEncoded));
  URLEncodeKeepingEscapes(str, isNotEncoded, ret.data());
  return ret;
}

std::string FilterScheme(std::string_view scheme) {
  if (!IsValidScheme(scheme)) {
    throw invalid_argument("Invalid scheme '{}'", scheme);
  }
  return ToLowerStr(scheme);
}

std::string FilterHost(std::string_view host) {
  const bool isIpLiteral = !host.empty() && host.front() == '[';
  if (isIpLiteral && (host.size() < 3 || host.back() != ']')) {
    throw invalid_argument("Invalid IP literal host '{}'", host);
  }
  const std::string_view hostContent = isIpLiteral ? host.substr(1, host.size() - 2) : host;
  for (char ch : hostContent) {
    switch (ch) {
      case '/':
      case '?':
      case '#':
      case '@':
      case '[':
      case ']':
        throw invalid_argument("Invalid character '{}' in host '{}'", ch, host);
      case ':':
        if (!isIpLiteral) {
          throw invalid_argument("Invalid character ':' in host '{}'", host);
        }
        break;
      default:
        if (isspace(ch)) {
          throw invalid_argument("Host cannot contain whitespace");
        }
        break;
    }
  }
  return ToLowerStr(host);
}

std::optional<uint16_t> FilterPort(std::optional<int> port) {
  if (!port) {
    return std::nullopt;
  }
  if (*port < kMinPort || *port > kMaxPort) {
    throw invalid_argument("Invalid port: {}. Must be between {} and {}", *port, kMinPort, kMaxPort);
  }
  return static_cast<uint16_t>(*port);
}

std::string FilterUserInfoComponent(std::string_view component) { return PercentEncodeExcept(component, {}); }

std::string FilterPath(std::string_view path) { return PercentEncodeExcept(path, kPathExtraChars); }

std::string FilterQueryOrFragment(std::string_view str) {
  return PercentEncodeExcept(str, kQueryOrFragmentExtraChars);
}

}  // namespace urikit
