#pragma once

#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "urikit/base-fd.hpp"
#include "urikit/byte-stream.hpp"
#include "urikit/stream-options.hpp"

namespace urikit {

// ByteStream over a file descriptor (regular file, pipe, socket...).
class FdStream : public ByteStream {
 public:
  // Opens 'path' with a fopen like 'mode': one of 'r', 'w', 'a', 'x', 'c', optionally followed by '+' and 'b'
  // (in any order). Throws std::invalid_argument for an unknown mode, std::system_error if the file cannot be
  // opened.
  FdStream(std::string_view path, std::string_view mode, StreamOptions options = {});

  // Adopts an opened file descriptor. Readability and writability are deduced from its access mode.
  // Throws std::invalid_argument if 'fd' is closed.
  explicit FdStream(BaseFd fd, StreamOptions options = {});

  using ByteStream::metadata;

  std::string read(std::size_t maxBytes) override;

  std::size_t write(std::string_view data) override;

  void seek(int64_t offset, Whence whence = Whence::Set) override;

  [[nodiscard]] std::size_t tell() const override;

  [[nodiscard]] bool eof() const override;

  [[nodiscard]] bool isReadable() const noexcept override { return _readable; }

  [[nodiscard]] bool isWritable() const noexcept override { return _writable; }

  [[nodiscard]] bool isSeekable() const noexcept override { return _seekable; }

  [[nodiscard]] std::optional<std::size_t> size() override;

  std::string contents() override;

  [[nodiscard]] StreamMetadata metadata() const override;

  void close() override;

  BaseFd detach() override;

  [[nodiscard]] int fd() const noexcept { return _fd.fd(); }

 private:
  void checkAttached() const;

  // Reads at most 'maxBytes' into 'buf', retrying on EINTR. Returns 0 at end of stream, -1 on error.
  ssize_t readSome(char *buf, std::size_t maxBytes) noexcept;

  void initCapabilities(StreamOptions options);

  BaseFd _fd;
  std::string _uri;
  std::string _mode;
  StreamMetadata _customMetadata;
  std::optional<std::size_t> _size;
  // position for non seekable descriptors, which cannot be queried with lseek
  std::size_t _streamPos{};
  bool _readable{};
  bool _writable{};
  bool _seekable{};
  bool _eof{};
};

}  // namespace urikit
