#include "urikit/base-fd.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "urikit/log.hpp"

namespace urikit {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd == kClosedFd) {
    return;
  }
  // the descriptor is released by the kernel even when close reports an error, so it is never retried
  const int fd = std::exchange(_fd, kClosedFd);
  if (::close(fd) == 0 || errno == EINTR) {
    log::debug("Closed fd # {}", fd);
  } else {
    const int savedErr = errno;
    log::error("Unable to close fd # {} (errno {}: {})", fd, savedErr, std::strerror(savedErr));
  }
}

int BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

}  // namespace urikit
