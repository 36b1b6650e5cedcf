#include "urikit/uri-query.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "urikit/uri.hpp"
#include "urikit/url-decode.hpp"

namespace urikit {

namespace {

constexpr char kPairSep = '&';
constexpr char kKeyValueSep = '=';

// Appends to 'out' the pairs of 'query' whose decoded key differs from 'decodedKey', and returns their number.
// Empty pairs are kept as is.
std::size_t AppendPairsWithoutKey(std::string_view query, std::string_view decodedKey, std::string &out) {
  std::size_t nbKeptPairs = 0;
  if (query.empty()) {
    return nbKeptPairs;
  }
  for (std::size_t pos = 0;;) {
    const auto pairEnd = query.find(kPairSep, pos);
    const std::string_view pair = query.substr(pos, pairEnd - pos);
    if (url::Decode(pair.substr(0, pair.find(kKeyValueSep))) != decodedKey) {
      if (nbKeptPairs != 0) {
        out.push_back(kPairSep);
      }
      out.append(pair);
      ++nbKeptPairs;
    }
    if (pairEnd == std::string_view::npos) {
      break;
    }
    pos = pairEnd + 1;
  }
  return nbKeptPairs;
}

}  // namespace

std::string EncodeQuerySeparators(std::string_view str) {
  std::string ret;
  ret.reserve(str.size());
  for (char ch : str) {
    switch (ch) {
      case kKeyValueSep:
        ret.append("%3D");
        break;
      case kPairSep:
        ret.append("%26");
        break;
      default:
        ret.push_back(ch);
        break;
    }
  }
  return ret;
}

Uri WithoutQueryValue(const Uri &uri, std::string_view key) {
  std::string query;
  AppendPairsWithoutKey(uri.query(), url::Decode(key), query);
  return uri.withQuery(query);
}

Uri WithQueryValue(const Uri &uri, std::string_view key, std::optional<std::string_view> value) {
  std::string query;
  if (AppendPairsWithoutKey(uri.query(), url::Decode(key), query) != 0) {
    query.push_back(kPairSep);
  }
  query.append(EncodeQuerySeparators(key));
  if (value) {
    query.push_back(kKeyValueSep);
    query.append(EncodeQuerySeparators(*value));
  }
  return uri.withQuery(query);
}

}  // namespace urikit
