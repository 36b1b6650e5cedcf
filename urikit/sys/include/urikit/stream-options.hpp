#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace urikit {

using StreamMetadata = std::map<std::string, std::string, std::less<>>;

// Options common to all byte streams.
struct StreamOptions {
  // Throws std::invalid_argument if a metadata key is empty.
  void validate() const;

  StreamOptions &withSize(std::size_t sz) {
    size = sz;
    return *this;
  }

  StreamOptions &withMetadata(std::string_view key, std::string_view value) {
    metadata.insert_or_assign(std::string(key), std::string(value));
    return *this;
  }

  // Size in bytes known in advance, returned by ByteStream::size() until the first write.
  std::optional<std::size_t> size;

  // Additional metadata returned with the built-in metadata of the stream. Takes precedence on built-in keys.
  StreamMetadata metadata;
};

}  // namespace urikit
