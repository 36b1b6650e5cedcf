#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "urikit/http-headers.hpp"
#include "urikit/http-message.hpp"
#include "urikit/http-method.hpp"
#include "urikit/uri.hpp"

namespace urikit::http {

// HTTP request holding an immutable Uri.
//
// Unless a Host header is given at construction, the Host header is derived from the URI ("host" or
// "host:port") and placed first. It is not set when the URI has no host.
class HttpRequest : public BasicHttpMessage<HttpRequest> {
 public:
  HttpRequest(Method method, Uri uri, HttpHeaders headers = {}, std::string_view body = {},
              std::string_view version = kDefaultProtocolVersion);

  // Parses 'method' (case-insensitively) and 'uri'.
  // Throws invalid_argument for an unknown method and malformed_uri for an invalid URI.
  HttpRequest(std::string_view method, std::string_view uri, HttpHeaders headers = {}, std::string_view body = {},
              std::string_view version = kDefaultProtocolVersion);

  [[nodiscard]] Method method() const noexcept { return _method; }

  [[nodiscard]] std::string_view methodStr() const noexcept { return MethodToStr(_method); }

  [[nodiscard]] HttpRequest withMethod(Method method) const;

  // Throws invalid_argument for an unknown method.
  [[nodiscard]] HttpRequest withMethod(std::string_view method) const;

  // Explicit request target if set, otherwise origin-form of the URI: path (or "/") followed by "?query" if any.
  [[nodiscard]] std::string requestTarget() const;

  // Throws invalid_argument if 'requestTarget' contains whitespace.
  [[nodiscard]] HttpRequest withRequestTarget(std::string_view requestTarget) const;

  [[nodiscard]] const Uri &uri() const noexcept { return _uri; }

  // Returns a request with given URI. The Host header is updated from it unless 'preserveHost' is true.
  // If 'uri' shares the representation of the current URI, the request is returned unchanged.
  [[nodiscard]] HttpRequest withUri(const Uri &uri, bool preserveHost = false) const;

 private:
  void updateHostFromUri();

  Method _method;
  Uri _uri;
  std::optional<std::string> _requestTarget;
};

}  // namespace urikit::http
