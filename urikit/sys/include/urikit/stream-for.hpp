#pragma once

#include <memory>
#include <string_view>

#include "urikit/byte-stream.hpp"
#include "urikit/stream-options.hpp"

namespace urikit {

// Creates a readable, writable and seekable stream containing 'content', positioned at its beginning.
std::shared_ptr<ByteStream> StreamFor(std::string_view content = {}, StreamOptions options = {});

}  // namespace urikit
