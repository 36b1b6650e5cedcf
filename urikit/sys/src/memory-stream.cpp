#include "urikit/memory-stream.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "urikit/base-fd.hpp"
#include "urikit/byte-stream.hpp"
#include "urikit/stream-options.hpp"

namespace urikit {

MemoryStream::MemoryStream(StreamOptions options) : MemoryStream(std::string(), std::move(options)) {}

MemoryStream::MemoryStream(std::string content, StreamOptions options)
    : _buf(std::move(content)), _size(options.size) {
  options.validate();
  _customMetadata = std::move(options.metadata);
}

void MemoryStream::checkAttached() const {
  if (_detached) {
    throw std::runtime_error("Stream is detached");
  }
}

std::string MemoryStream::read(std::size_t maxBytes) {
  checkAttached();
  if (maxBytes == 0) {
    return {};
  }
  const std::size_t nbAvailable = _pos < _buf.size() ? _buf.size() - _pos : 0;
  const std::size_t nbRead = std::min(maxBytes, nbAvailable);
  if (nbRead == 0) {
    _eof = true;
    return {};
  }
  std::string ret(_buf, _pos, nbRead);
  _pos += nbRead;
  return ret;
}

std::size_t MemoryStream::write(std::string_view data) {
  checkAttached();
  _size.reset();
  if (_buf.size() < _pos + data.size()) {
    _buf.resize(_pos + data.size());
  }
  _buf.replace(_pos, data.size(), data);
  _pos += data.size();
  return data.size();
}

void MemoryStream::seek(int64_t offset, Whence whence) {
  checkAttached();
  int64_t base;
  switch (whence) {
    case Whence::Set:
      base = 0;
      break;
    case Whence::Current:
      base = static_cast<int64_t>(_pos);
      break;
    case Whence::End:
      base = static_cast<int64_t>(_buf.size());
      break;
    default:
      throw std::invalid_argument(fmt::format("Invalid whence {}", static_cast<int>(whence)));
  }
  if (offset < -base || (offset > 0 && offset > std::numeric_limits<int64_t>::max() - base)) {
    throw std::runtime_error(
        fmt::format("Unable to seek to stream position {} with whence {}", offset, static_cast<int>(whence)));
  }
  _pos = static_cast<std::size_t>(base + offset);
  _eof = false;
}

std::size_t MemoryStream::tell() const {
  checkAttached();
  return _pos;
}

bool MemoryStream::eof() const {
  checkAttached();
  return _eof;
}

std::optional<std::size_t> MemoryStream::size() {
  if (_detached) {
    return std::nullopt;
  }
  if (_size) {
    return _size;
  }
  return _buf.size();
}

std::string MemoryStream::contents() {
  checkAttached();
  std::string ret;
  if (_pos < _buf.size()) {
    ret.assign(_buf, _pos);
    _pos = _buf.size();
  }
  _eof = true;
  return ret;
}

StreamMetadata MemoryStream::metadata() const {
  StreamMetadata ret;
  if (_detached) {
    return ret;
  }
  ret.emplace("mode", "w+b");
  ret.emplace("seekable", "true");
  ret.emplace("stream_type", "memory");
  ret.emplace("uri", "memory");
  for (const auto &[key, value] : _customMetadata) {
    ret.insert_or_assign(key, value);
  }
  return ret;
}

BaseFd MemoryStream::detach() {
  _detached = true;
  _buf = std::string();
  _customMetadata.clear();
  _size.reset();
  _pos = 0;
  return BaseFd();
}

}  // namespace urikit
