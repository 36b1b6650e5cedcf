#include "urikit/stream-options.hpp"

#include <stdexcept>

namespace urikit {

void StreamOptions::validate() const {
  if (metadata.contains(std::string_view())) {
    throw std::invalid_argument("StreamOptions.metadata keys cannot be empty");
  }
}

}  // namespace urikit
