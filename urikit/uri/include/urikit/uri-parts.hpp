#pragma once

#include <optional>
#include <string>

namespace urikit {

// Raw components of a URI reference as produced by SplitUri, or assembled by hand for Uri::fromParts.
// A component is std::nullopt when it is absent, which is different from present but empty
// ("http://h?" has an empty query, "http://h" has none).
// Values are not normalized: case, percent-encoding and default ports are handled by the Uri filters.
struct UriParts {
  bool operator==(const UriParts &) const noexcept = default;

  std::optional<std::string> scheme;
  std::optional<std::string> user;
  std::optional<std::string> pass;
  std::optional<std::string> host;
  // Kept wider than the valid range so that out of range values reach the port filter.
  std::optional<int> port;
  std::optional<std::string> path;
  std::optional<std::string> query;
  std::optional<std::string> fragment;
};

}  // namespace urikit
