#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "urikit/byte-stream.hpp"
#include "urikit/http-headers.hpp"
#include "urikit/invalid_argument_exception.hpp"
#include "urikit/stream-for.hpp"

namespace urikit::http {

inline constexpr std::string_view kDefaultProtocolVersion = "1.1";

// Common part of HTTP messages: protocol version, headers and body.
//
// Messages are values: 'with' methods leave the current object untouched and return a modified copy of the
// derived message type. Copies share the same body stream.
template <class Derived>
class BasicHttpMessage {
 public:
  [[nodiscard]] std::string_view protocolVersion() const noexcept { return _protocolVersion; }

  [[nodiscard]] Derived withProtocolVersion(std::string_view version) const {
    Derived ret = derived();
    ret._protocolVersion = version;
    return ret;
  }

  [[nodiscard]] const HttpHeaders &headers() const noexcept { return _headers; }

  [[nodiscard]] bool hasHeader(std::string_view name) const { return _headers.contains(name); }

  // Values of header 'name' (case-insensitive), empty if absent.
  [[nodiscard]] std::span<const std::string> header(std::string_view name) const { return _headers.values(name); }

  // Values of header 'name' joined by ", ", empty if absent.
  [[nodiscard]] std::string headerLine(std::string_view name) const { return _headers.line(name); }

  // Replaces the header 'name'.
  [[nodiscard]] Derived withHeader(std::string_view name, std::string_view value) const {
    Derived ret = derived();
    ret._headers.set(name, value);
    return ret;
  }

  [[nodiscard]] Derived withHeader(std::string_view name, std::span<const std::string> values) const {
    Derived ret = derived();
    ret._headers.set(name, values);
    return ret;
  }

  // Appends values to the header 'name', which is created if needed.
  [[nodiscard]] Derived withAddedHeader(std::string_view name, std::string_view value) const {
    Derived ret = derived();
    ret._headers.add(name, value);
    return ret;
  }

  [[nodiscard]] Derived withAddedHeader(std::string_view name, std::span<const std::string> values) const {
    Derived ret = derived();
    ret._headers.add(name, values);
    return ret;
  }

  // Appends all given header fields.
  [[nodiscard]] Derived withHeaders(std::span<const HeaderField> fields) const {
    Derived ret = derived();
    ret._headers.merge(fields);
    return ret;
  }

  [[nodiscard]] Derived withoutHeader(std::string_view name) const {
    Derived ret = derived();
    ret._headers.erase(name);
    return ret;
  }

  [[nodiscard]] const std::shared_ptr<ByteStream> &body() const noexcept { return _body; }

  [[nodiscard]] Derived withBody(std::shared_ptr<ByteStream> body) const {
    if (!body) {
      throw invalid_argument("Message body cannot be null");
    }
    Derived ret = derived();
    ret._body = std::move(body);
    return ret;
  }

 protected:
  explicit BasicHttpMessage(HttpHeaders headers = {}, std::shared_ptr<ByteStream> body = StreamFor(),
                            std::string_view version = kDefaultProtocolVersion)
      : _protocolVersion(version), _headers(std::move(headers)), _body(std::move(body)) {
    if (!_body) {
      throw invalid_argument("Message body cannot be null");
    }
  }

  [[nodiscard]] HttpHeaders &mutableHeaders() noexcept { return _headers; }

 private:
  [[nodiscard]] const Derived &derived() const noexcept { return static_cast<const Derived &>(*this); }

  std::string _protocolVersion;
  HttpHeaders _headers;
  std::shared_ptr<ByteStream> _body;
};

// HTTP message without start line specifics.
class HttpMessage : public BasicHttpMessage<HttpMessage> {
 public:
  explicit HttpMessage(HttpHeaders headers = {}, std::shared_ptr<ByteStream> body = StreamFor(),
                       std::string_view version = kDefaultProtocolVersion)
      : BasicHttpMessage(std::move(headers), std::move(body), version) {}
};

}  // namespace urikit::http
