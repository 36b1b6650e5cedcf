#include "urikit/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "urikit/char-hexadecimal-converter.hpp"

namespace urikit::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        const int v1 = first + 2 < last ? from_hex_digit(first[1]) : -1;
        const int v2 = v1 < 0 ? -1 : from_hex_digit(first[2]);
        if (v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          // lone '%': keep it and decode what follows normally ("%%41" -> "%A")
          *out++ = '%';
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        first += 2;
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::string Decode(std::string_view data) {
  std::string ret(data);
  char* last = DecodeInPlace(ret.data(), ret.data() + ret.size(), '+', /*strictInvalid*/ false);
  ret.resize(static_cast<std::size_t>(last - ret.data()));
  return ret;
}

}  // namespace urikit::url
