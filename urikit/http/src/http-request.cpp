#include "urikit/http-request.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "urikit/cctype.hpp"
#include "urikit/http-headers.hpp"
#include "urikit/http-message.hpp"
#include "urikit/http-method.hpp"
#include "urikit/invalid_argument_exception.hpp"
#include "urikit/stream-for.hpp"
#include "urikit/uri.hpp"

namespace urikit::http {

namespace {

constexpr std::string_view kHostHeaderName = "Host";

Method ParseMethod(std::string_view method) {
  const std::optional<Method> ret = MethodStrToOptEnum(method);
  if (!ret) {
    throw invalid_argument("Invalid HTTP method '{}'", method);
  }
  return *ret;
}

}  // namespace

HttpRequest::HttpRequest(Method method, Uri uri, HttpHeaders headers, std::string_view body,
                         std::string_view version)
    : BasicHttpMessage(std::move(headers), StreamFor(body), version),
      _method(method),
      _uri(std::move(uri)) {
  if (!hasHeader(kHostHeaderName)) {
    updateHostFromUri();
  }
}

HttpRequest::HttpRequest(std::string_view method, std::string_view uri, HttpHeaders headers, std::string_view body,
                         std::string_view version)
    : HttpRequest(ParseMethod(method), Uri(uri), std::move(headers), body, version) {}

HttpRequest HttpRequest::withMethod(Method method) const {
  HttpRequest ret = *this;
  ret._method = method;
  return ret;
}

HttpRequest HttpRequest::withMethod(std::string_view method) const { return withMethod(ParseMethod(method)); }

std::string HttpRequest::requestTarget() const {
  if (_requestTarget) {
    return *_requestTarget;
  }

  std::string target(_uri.path().empty() ? std::string_view("/") : _uri.path());
  const std::string_view query = _uri.query();
  if (!query.empty()) {
    target.push_back('?');
    target.append(query);
  }
  return target;
}

HttpRequest HttpRequest::withRequestTarget(std::string_view requestTarget) const {
  if (std::ranges::any_of(requestTarget, [](char ch) { return isspace(ch); })) {
    throw invalid_argument("Invalid request target provided; cannot contain whitespace");
  }
  HttpRequest ret = *this;
  ret._requestTarget.emplace(requestTarget);
  return ret;
}

HttpRequest HttpRequest::withUri(const Uri &uri, bool preserveHost) const {
  if (uri.isSameInstance(_uri)) {
    return *this;
  }
  HttpRequest ret = *this;
  ret._uri = uri;
  if (!preserveHost) {
    ret.updateHostFromUri();
  }
  return ret;
}

void HttpRequest::updateHostFromUri() {
  std::string host(_uri.host());
  if (host.empty()) {
    return;
  }
  if (const auto port = _uri.port(); port) {
    host.push_back(':');
    host.append(std::to_string(*port));
  }
  mutableHeaders().setFirst(kHostHeaderName, host);
}

}  // namespace urikit::http
