#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>

#include "urikit/base-fd.hpp"
#include "urikit/stream-options.hpp"

namespace urikit {

enum class Whence : int8_t { Set = SEEK_SET, Current = SEEK_CUR, End = SEEK_END };

// Abstract sequence of bytes, typically used as the body of an HTTP message.
//
// A stream can be detached from its underlying resource (see detach() and close()).
// Once detached, all I/O methods throw std::runtime_error("Stream is detached"), capability queries return
// false, size() returns std::nullopt and metadata is empty.
//
// I/O failures reported by the system are thrown as std::system_error (which is a std::runtime_error).
class ByteStream {
 public:
  ByteStream() noexcept = default;

  ByteStream(const ByteStream &) = delete;
  ByteStream &operator=(const ByteStream &) = delete;
  ByteStream(ByteStream &&) noexcept = default;
  ByteStream &operator=(ByteStream &&) noexcept = default;

  virtual ~ByteStream() = default;

  // Reads up to 'maxBytes' bytes from the current position. An empty result with a non zero 'maxBytes'
  // means that the end of the stream was reached, eof() then returns true.
  virtual std::string read(std::size_t maxBytes) = 0;

  // Writes 'data' at the current position and returns the number of bytes written.
  // Invalidates the size known in advance, if any.
  virtual std::size_t write(std::string_view data) = 0;

  // Moves the current position. Throws std::runtime_error if the stream is not seekable or if the resulting
  // position is invalid. Clears the eof indicator.
  virtual void seek(int64_t offset, Whence whence = Whence::Set) = 0;

  void rewind() { seek(0); }

  // Current position.
  [[nodiscard]] virtual std::size_t tell() const = 0;

  // Tells whether a read reached the end of the stream.
  [[nodiscard]] virtual bool eof() const = 0;

  [[nodiscard]] virtual bool isReadable() const noexcept = 0;

  [[nodiscard]] virtual bool isWritable() const noexcept = 0;

  [[nodiscard]] virtual bool isSeekable() const noexcept = 0;

  // Size in bytes, if known.
  [[nodiscard]] virtual std::optional<std::size_t> size() = 0;

  // Reads the remaining bytes, from the current position until the end.
  virtual std::string contents() = 0;

  // Reads the whole stream from its beginning.
  // Never throws for I/O errors: an empty string is returned if the stream cannot be rewound or read.
  std::string str();

  // Built-in metadata merged with the custom metadata given at construction (custom values take precedence).
  [[nodiscard]] virtual StreamMetadata metadata() const = 0;

  // Value of a single metadata entry, std::nullopt if absent or if the stream is detached.
  [[nodiscard]] std::optional<std::string> metadata(std::string_view key) const;

  // Closes the underlying resource, and detaches the stream. No-op if already detached.
  virtual void close() = 0;

  // Separates the underlying resource from the stream and returns it (a closed BaseFd if the stream is
  // not backed by a file descriptor or already detached).
  virtual BaseFd detach() = 0;
};

}  // namespace urikit
