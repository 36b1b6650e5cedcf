#pragma once

#include <string>
#include <string_view>

namespace urikit::url {

// Decodes within the provided string buffer, compacting percent-encoded
// sequences and (optionally) translating '+' to 'plusAs'. Returns nullptr on
// invalid encoding (truncated % or non-hex digits) when strictInvalid is true, leaving the string in an unspecified
// partially modified state (caller can decide to discard it).
// When strictInvalid is false, a '%' that does not start a valid triplet is copied and the characters after it
// are decoded normally.
// Returns a pointer to the new logical end of the 'str' decoded sequence.
// plusAs = ' ' should be used only for form encoded query string values, not for paths.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

// Best effort raw percent-decoding (RFC 3986, '+' stays '+') into a new string.
// A '%' not followed by two hexadecimal digits is kept as is.
std::string Decode(std::string_view data);

}  // namespace urikit::url
