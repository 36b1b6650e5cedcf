#include "urikit/fd-stream.hpp"

#include <fcntl.h>
#include <fmt/format.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "urikit/base-fd.hpp"
#include "urikit/byte-stream.hpp"
#include "urikit/errno-throw.hpp"
#include "urikit/log.hpp"
#include "urikit/stream-options.hpp"

namespace urikit {

namespace {

constexpr mode_t kCreatePermissions = 0666;

struct OpenMode {
  int flags;
  bool readable;
  bool writable;
};

OpenMode ParseOpenMode(std::string_view mode) {
  if (mode.empty()) {
    throw std::invalid_argument("Stream mode cannot be empty");
  }
  bool plus = false;
  bool binary = false;
  for (char ch : mode.substr(1)) {
    if (ch == '+' && !plus) {
      plus = true;
    } else if (ch == 'b' && !binary) {
      binary = true;
    } else {
      throw std::invalid_argument(fmt::format("Invalid stream mode '{}'", mode));
    }
  }

  int flags = O_CLOEXEC;
  switch (mode.front()) {
    case 'r':
      break;
    case 'w':
      flags |= O_CREAT | O_TRUNC;
      break;
    case 'a':
      flags |= O_CREAT | O_APPEND;
      break;
    case 'x':
      flags |= O_CREAT | O_EXCL;
      break;
    case 'c':
      flags |= O_CREAT;
      break;
    default:
      throw std::invalid_argument(fmt::format("Invalid stream mode '{}'", mode));
  }

  const bool readOnly = mode.front() == 'r';
  if (plus) {
    flags |= O_RDWR;
  } else {
    flags |= readOnly ? O_RDONLY : O_WRONLY;
  }
  return {flags, readOnly || plus, !readOnly || plus};
}

int OpenFile(std::string_view path, std::string_view mode, int flags) {
  const std::string pathStr(path);
  int fd;
  do {
    fd = ::open(pathStr.c_str(), flags, kCreatePermissions);
  } while (fd == -1 && errno == EINTR);
  if (fd == -1) {
    const int savedErr = errno;
    log::error("Unable to open '{}' using mode '{}' (errno {}: {})", path, mode, savedErr, std::strerror(savedErr));
    errno = savedErr;
    throw_errno("Unable to open '{}' using mode '{}'", path, mode);
  }
  return fd;
}

std::string_view AccessModeStr(int fd) {
  const int flags = ::fcntl(fd, F_GETFL);
  if (flags == -1) {
    throw_errno("fcntl(F_GETFL) failed for fd # {}", fd);
  }
  switch (flags & O_ACCMODE) {
    case O_RDONLY:
      return "r";
    case O_WRONLY:
      return (flags & O_APPEND) != 0 ? "a" : "w";
    default:
      return (flags & O_APPEND) != 0 ? "a+" : "r+";
  }
}

}  // namespace

FdStream::FdStream(std::string_view path, std::string_view mode, StreamOptions options) : _uri(path), _mode(mode) {
  const OpenMode openMode = ParseOpenMode(mode);
  options.validate();
  _fd = BaseFd(OpenFile(path, mode, openMode.flags));
  _readable = openMode.readable;
  _writable = openMode.writable;
  initCapabilities(std::move(options));
}

FdStream::FdStream(BaseFd fd, StreamOptions options) : _fd(std::move(fd)) {
  if (!_fd) {
    throw std::invalid_argument("Stream must be an opened file descriptor");
  }
  options.validate();
  _mode = AccessModeStr(_fd.fd());
  _readable = _mode != "w" && _mode != "a";
  _writable = _mode != "r";
  initCapabilities(std::move(options));
}

void FdStream::initCapabilities(StreamOptions options) {
  _seekable = ::lseek(_fd.fd(), 0, SEEK_CUR) != -1;
  _size = options.size;
  _customMetadata = std::move(options.metadata);
}

void FdStream::checkAttached() const {
  if (!_fd) {
    throw std::runtime_error("Stream is detached");
  }
}

ssize_t FdStream::readSome(char *buf, std::size_t maxBytes) noexcept {
  ssize_t nbRead;
  do {
    nbRead = ::read(_fd.fd(), buf, maxBytes);
  } while (nbRead == -1 && errno == EINTR);
  if (nbRead == 0) {
    _eof = true;
  } else if (nbRead > 0) {
    _streamPos += static_cast<std::size_t>(nbRead);
  }
  return nbRead;
}

std::string FdStream::read(std::size_t maxBytes) {
  checkAttached();
  if (!_readable) {
    throw std::runtime_error("Cannot read from non-readable stream");
  }
  std::string ret;
  if (maxBytes == 0) {
    return ret;
  }
  ssize_t nbRead = 0;
  ret.resize_and_overwrite(maxBytes, [this, &nbRead](char *data, std::size_t sz) {
    nbRead = readSome(data, sz);
    return nbRead > 0 ? static_cast<std::size_t>(nbRead) : 0UL;
  });
  if (nbRead == -1) {
    throw_errno("Unable to read from stream fd # {}", _fd.fd());
  }
  return ret;
}

std::size_t FdStream::write(std::string_view data) {
  checkAttached();
  if (!_writable) {
    throw std::runtime_error("Cannot write to a non-writable stream");
  }

  // size cannot be known after writing anything
  _size.reset();

  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t ret = ::write(_fd.fd(), data.data() + written, data.size() - written);
    if (ret == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw_errno("Unable to write to stream fd # {}", _fd.fd());
    }
    written += static_cast<std::size_t>(ret);
  }
  _streamPos += written;
  return written;
}

void FdStream::seek(int64_t offset, Whence whence) {
  checkAttached();
  if (!_seekable) {
    throw std::runtime_error("Stream is not seekable");
  }
  if (::lseek(_fd.fd(), static_cast<off_t>(offset), static_cast<int>(whence)) == -1) {
    throw_errno("Unable to seek to stream position {} with whence {}", offset, static_cast<int>(whence));
  }
  _eof = false;
}

std::size_t FdStream::tell() const {
  checkAttached();
  if (!_seekable) {
    return _streamPos;
  }
  const off_t pos = ::lseek(_fd.fd(), 0, SEEK_CUR);
  if (pos == -1) {
    throw_errno("Unable to determine stream position");
  }
  return static_cast<std::size_t>(pos);
}

bool FdStream::eof() const {
  checkAttached();
  return _eof;
}

std::optional<std::size_t> FdStream::size() {
  if (_size || !_fd) {
    return _size;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) == 0 && S_ISREG(st.st_mode)) {
    _size = static_cast<std::size_t>(st.st_size);
  }
  return _size;
}

std::string FdStream::contents() {
  checkAttached();
  if (!_readable) {
    throw std::runtime_error("Unable to read stream contents");
  }

  static constexpr std::size_t kBufSize = 8192;

  std::string content;
  for (;;) {
    const std::size_t oldSize = content.size();
    // capture lastRead to inspect the result after the non-throwing lambda
    ssize_t lastRead = 0;
    content.resize_and_overwrite(oldSize + kBufSize, [this, oldSize, &lastRead](char *data, std::size_t) {
      lastRead = readSome(data + oldSize, kBufSize);
      return lastRead > 0 ? oldSize + static_cast<std::size_t>(lastRead) : oldSize;
    });
    if (lastRead == 0) {
      break;
    }
    if (lastRead == -1) {
      throw_errno("Unable to read stream contents of fd # {}", _fd.fd());
    }
  }
  return content;
}

StreamMetadata FdStream::metadata() const {
  StreamMetadata ret;
  if (!_fd) {
    return ret;
  }
  ret.emplace("mode", _mode);
  ret.emplace("seekable", _seekable ? "true" : "false");
  ret.emplace("stream_type", "fd");
  ret.emplace("uri", _uri);
  for (const auto &[key, value] : _customMetadata) {
    ret.insert_or_assign(key, value);
  }
  return ret;
}

void FdStream::close() {
  if (_fd) {
    _fd.close();
    detach();
  }
}

BaseFd FdStream::detach() {
  BaseFd ret(std::move(_fd));
  _uri.clear();
  _size.reset();
  _readable = false;
  _writable = false;
  _seekable = false;
  return ret;
}

}  // namespace urikit
