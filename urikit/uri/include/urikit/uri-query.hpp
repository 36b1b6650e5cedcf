#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "urikit/uri.hpp"

namespace urikit {

// Returns a copy of 'uri' whose query no longer contains any "key[=value]" pair with given key,
// keys being compared after percent-decoding.
[[nodiscard]] Uri WithoutQueryValue(const Uri &uri, std::string_view key);

// Replaces all "key[=value]" pairs of given key (compared after percent-decoding) by a single pair appended at
// the end of the query. A std::nullopt value appends the bare key, without '='.
// '=' and '&' inside key and value are encoded, the rest of the encoding is done by Uri::withQuery.
[[nodiscard]] Uri WithQueryValue(const Uri &uri, std::string_view key, std::optional<std::string_view> value);

// Encodes query separators ('=' and '&') of a key or value so that it can be inserted in a query pair.
std::string EncodeQuerySeparators(std::string_view str);

}  // namespace urikit
