#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace urikit {

struct SchemeDefaultPort {
  std::string_view scheme;
  uint16_t port;
};

// Well known ports of schemes, sorted by scheme name.
inline constexpr SchemeDefaultPort kSchemeDefaultPorts[] = {
    {"ftp", 21},   {"gopher", 70},  {"http", 80},    {"https", 443}, {"imap", 143}, {"ldap", 389}, {"news", 119},
    {"nntp", 119}, {"pop", 110},    {"telnet", 23},  {"tn3270", 23}, {"ws", 80},    {"wss", 443},
};

// Returns the default port of given lower case scheme, or std::nullopt if the scheme is unknown.
constexpr std::optional<uint16_t> SchemeDefaultPortOf(std::string_view scheme) noexcept {
  for (const SchemeDefaultPort &entry : kSchemeDefaultPorts) {
    if (entry.scheme == scheme) {
      return entry.port;
    }
  }
  return std::nullopt;
}

}  // namespace urikit
