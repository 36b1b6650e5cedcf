#include "urikit/uri-split.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string_view>
#include <system_error>

#include "urikit/cctype.hpp"
#include "urikit/string-equal-ignore-case.hpp"
#include "urikit/uri-filter.hpp"
#include "urikit/uri-parts.hpp"

namespace urikit {

namespace {

constexpr std::size_t kMaxPortDigits = 5;
constexpr int kMaxPortValue = 65535;

bool SplitPort(std::string_view portStr, UriParts &parts) {
  // RFC 3986 §3.2.3: an empty port after ':' is allowed and means no port
  if (portStr.empty()) {
    return true;
  }
  if (portStr.size() > kMaxPortDigits || !std::ranges::all_of(portStr, [](char ch) { return isdigit(ch); })) {
    return false;
  }
  int port{};
  const auto [ptr, errc] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), port);
  if (errc != std::errc() || port > kMaxPortValue) {
    return false;
  }
  parts.port = port;
  return true;
}

// authority = [ userinfo "@" ] host [ ":" port ]
bool SplitAuthority(std::string_view authority, UriParts &parts) {
  const auto atPos = authority.rfind('@');
  if (atPos != std::string_view::npos) {
    const std::string_view userInfo = authority.substr(0, atPos);
    const auto colonPos = userInfo.find(':');
    parts.user.emplace(userInfo.substr(0, colonPos));
    if (colonPos != std::string_view::npos) {
      parts.pass.emplace(userInfo.substr(colonPos + 1));
    }
    authority.remove_prefix(atPos + 1);
  }

  std::string_view host;
  std::string_view portStr;
  if (authority.starts_with('[')) {
    const auto closingPos = authority.find(']');
    if (closingPos == std::string_view::npos) {
      return false;
    }
    host = authority.substr(0, closingPos + 1);
    const std::string_view afterHost = authority.substr(closingPos + 1);
    if (!afterHost.empty()) {
      if (afterHost.front() != ':') {
        return false;
      }
      portStr = afterHost.substr(1);
    }
  } else {
    const auto colonPos = authority.find(':');
    host = authority.substr(0, colonPos);
    if (colonPos != std::string_view::npos) {
      portStr = authority.substr(colonPos + 1);
    }
  }

  if (!SplitPort(portStr, parts)) {
    return false;
  }
  if (!host.empty()) {
    parts.host.emplace(host);
  }
  return true;
}

}  // namespace

std::optional<UriParts> SplitUri(std::string_view uri) {
  UriParts parts;

  // scheme ":" - the scheme delimiter must come before any other delimiter
  const auto schemeEnd = uri.find_first_of(":/?#");
  if (schemeEnd != std::string_view::npos && schemeEnd != 0 && uri[schemeEnd] == ':' &&
      IsValidScheme(uri.substr(0, schemeEnd))) {
    parts.scheme.emplace(uri.substr(0, schemeEnd));
    uri.remove_prefix(schemeEnd + 1);
  }

  if (uri.starts_with("//")) {
    uri.remove_prefix(2);
    const std::string_view authority = uri.substr(0, uri.find_first_of("/?#"));
    uri.remove_prefix(authority.size());
    if (!SplitAuthority(authority, parts)) {
      return std::nullopt;
    }
    if (!parts.host) {
      // "file:///path" is the only accepted form of an empty authority
      const bool isFileScheme = parts.scheme && CaseInsensitiveEqual(*parts.scheme, "file");
      if (!isFileScheme || parts.user || parts.port) {
        return std::nullopt;
      }
    }
  }

  const auto fragmentPos = uri.find('#');
  if (fragmentPos != std::string_view::npos) {
    parts.fragment.emplace(uri.substr(fragmentPos + 1));
    uri = uri.substr(0, fragmentPos);
  }

  const auto queryPos = uri.find('?');
  if (queryPos != std::string_view::npos) {
    parts.query.emplace(uri.substr(queryPos + 1));
    uri = uri.substr(0, queryPos);
  }

  if (!uri.empty()) {
    parts.path.emplace(uri);
  }

  return parts;
}

}  // namespace urikit
