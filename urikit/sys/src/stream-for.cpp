#include "urikit/stream-for.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "urikit/byte-stream.hpp"
#include "urikit/memory-stream.hpp"
#include "urikit/stream-options.hpp"

namespace urikit {

std::shared_ptr<ByteStream> StreamFor(std::string_view content, StreamOptions options) {
  return std::make_shared<MemoryStream>(std::string(content), std::move(options));
}

}  // namespace urikit
