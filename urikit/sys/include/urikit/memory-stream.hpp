#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "urikit/base-fd.hpp"
#include "urikit/byte-stream.hpp"
#include "urikit/stream-options.hpp"

namespace urikit {

// Readable, writable and seekable ByteStream over an in-memory buffer.
// Seeking past the end is allowed, a subsequent write fills the gap with null bytes.
class MemoryStream : public ByteStream {
 public:
  explicit MemoryStream(StreamOptions options = {});

  // Creates a stream initially containing 'content', positioned at its beginning.
  explicit MemoryStream(std::string content, StreamOptions options = {});

  using ByteStream::metadata;

  std::string read(std::size_t maxBytes) override;

  std::size_t write(std::string_view data) override;

  void seek(int64_t offset, Whence whence = Whence::Set) override;

  [[nodiscard]] std::size_t tell() const override;

  [[nodiscard]] bool eof() const override;

  [[nodiscard]] bool isReadable() const noexcept override { return !_detached; }

  [[nodiscard]] bool isWritable() const noexcept override { return !_detached; }

  [[nodiscard]] bool isSeekable() const noexcept override { return !_detached; }

  [[nodiscard]] std::optional<std::size_t> size() override;

  std::string contents() override;

  [[nodiscard]] StreamMetadata metadata() const override;

  void close() override { detach(); }

  // Drops the buffer. The returned BaseFd is always closed.
  BaseFd detach() override;

 private:
  void checkAttached() const;

  std::string _buf;
  StreamMetadata _customMetadata;
  std::optional<std::size_t> _size;
  std::size_t _pos{};
  bool _eof{};
  bool _detached{};
};

}  // namespace urikit
