#pragma once

#include <optional>
#include <string_view>

#include "urikit/uri-parts.hpp"

namespace urikit {

// Splits a URI reference into its RFC 3986 components, without any normalization.
// Returns std::nullopt if the string has no structurally valid decomposition, for instance:
//  - an authority with an empty host ("http://", "///"), except for "file:///path"
//  - a host followed by something else than a numeric port ("urn://host:with:colon")
//  - a port that does not fit in 16 bits, or an unterminated IP literal ("//[::1")
[[nodiscard]] std::optional<UriParts> SplitUri(std::string_view uri);

}  // namespace urikit
