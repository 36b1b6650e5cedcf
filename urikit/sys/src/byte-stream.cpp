#include "urikit/byte-stream.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "urikit/log.hpp"
#include "urikit/stream-options.hpp"

namespace urikit {

std::string ByteStream::str() {
  try {
    rewind();
    return contents();
  } catch (const std::runtime_error &ex) {
    log::debug("Unable to read whole stream: {}", ex.what());
  }
  return {};
}

std::optional<std::string> ByteStream::metadata(std::string_view key) const {
  const StreamMetadata meta = metadata();
  const auto it = meta.find(key);
  if (it == meta.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace urikit
