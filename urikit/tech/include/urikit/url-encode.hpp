#pragma once

#include <string_view>

#include "urikit/char-hexadecimal-converter.hpp"

namespace urikit {

// Returns true if data[pos] is a '%' introducing a well formed percent-encoded triplet.
constexpr bool IsPercentEncodedTriplet(std::string_view data, std::string_view::size_type pos) {
  return data[pos] == '%' && pos + 2 < data.size() && is_hex_digit(data[pos + 1]) && is_hex_digit(data[pos + 2]);
}

/// Size of the output of URLEncodeKeepingEscapes: 1 byte for kept chars and already percent-encoded triplets
/// (%XX) count 3. Any other '%' is counted as encoded ("%25").
template <class IsNotEncodedFunc>
constexpr auto URLEncodedSizeKeepingEscapes(std::string_view data, IsNotEncodedFunc isNotEncodedFunc) {
  std::string_view::size_type nbChars = 0;

  for (std::string_view::size_type pos = 0; pos < data.size(); ++pos) {
    if (IsPercentEncodedTriplet(data, pos)) {
      nbChars += 3UL;
      pos += 2;
    } else if (data[pos] != '%' && isNotEncodedFunc(data[pos])) {
      ++nbChars;
    } else {
      nbChars += 3UL;
    }
  }

  return nbChars;
}

/// Converts the given input string to a URL encoded string.
/// All input characters 'ch' for which isNotEncodedFunc(ch) is false are converted to %NN, NN being upper case
/// hexadecimal. A '%' followed by two hexadecimal digits is copied as is, so that encoding an already encoded string
/// yields the same string ("%2F" never becomes "%252F").
/// 'buf' should have space for at least URLEncodedSizeKeepingEscapes(data, isNotEncodedFunc) bytes.
/// Returns a pointer to the char immediately after the last written char in the buffer.
template <class IsNotEncodedFunc>
char* URLEncodeKeepingEscapes(std::string_view data, IsNotEncodedFunc isNotEncodedFunc, char* buf) {
  for (std::string_view::size_type pos = 0; pos < data.size(); ++pos) {
    const char ch = data[pos];
    if (IsPercentEncodedTriplet(data, pos)) {
      *buf++ = ch;
      *buf++ = data[++pos];
      *buf++ = data[++pos];
    } else if (ch != '%' && isNotEncodedFunc(ch)) {
      *buf++ = ch;
    } else {
      *buf = '%';
      buf = to_upper_hex(ch, ++buf);
    }
  }
  return buf;
}

}  // namespace urikit
