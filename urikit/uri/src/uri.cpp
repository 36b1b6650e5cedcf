#include "urikit/uri.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "urikit/invalid_argument_exception.hpp"
#include "urikit/log.hpp"
#include "urikit/scheme-default-ports.hpp"
#include "urikit/uri-deprecation.hpp"
#include "urikit/uri-errors.hpp"
#include "urikit/uri-filter.hpp"
#include "urikit/uri-parts.hpp"
#include "urikit/uri-split.hpp"

namespace urikit {

namespace {

const AuxiliaryParams kEmptyAuxiliaryParams;

bool RequiresHost(std::string_view scheme) noexcept { return scheme == "http" || scheme == "https"; }

}  // namespace

std::string Uri::Rep::authority() const {
  std::string ret;
  if (!userInfo.empty()) {
    ret.append(userInfo);
    ret.push_back('@');
  }
  ret.append(host);
  if (port) {
    ret.push_back(':');
    ret.append(std::to_string(*port));
  }
  return ret;
}

void Uri::Rep::applyParts(const UriParts &parts) {
  scheme = parts.scheme ? FilterScheme(*parts.scheme) : std::string();
  userInfo = parts.user ? FilterUserInfoComponent(*parts.user) : std::string();
  host = parts.host ? FilterHost(*parts.host) : std::string();
  port = FilterPort(parts.port);
  path = parts.path ? FilterPath(*parts.path) : std::string();
  query = parts.query ? FilterQueryOrFragment(*parts.query) : std::string();
  fragment = parts.fragment ? FilterQueryOrFragment(*parts.fragment) : std::string();
  if (parts.pass) {
    userInfo.push_back(':');
    userInfo.append(FilterUserInfoComponent(*parts.pass));
  }

  removeDefaultPort();
}

void Uri::Rep::applyAuxiliaryParams() {
  if (!auxiliaryParams) {
    return;
  }
  if (const auto it = auxiliaryParams->find("path"); it != auxiliaryParams->end()) {
    path = FilterPath(it->second);
  }
  if (const auto it = auxiliaryParams->find("query"); it != auxiliaryParams->end()) {
    query = FilterQueryOrFragment(it->second);
  }
}

void Uri::Rep::removeDefaultPort() noexcept {
  if (port && port == SchemeDefaultPortOf(scheme)) {
    port.reset();
  }
}

void Uri::Rep::normalize() {
  if (host.empty() && RequiresHost(scheme)) {
    host = kHttpDefaultHost;
  }

  if (isAuthorityEmpty()) {
    if (path.starts_with("//")) {
      throw invalid_state("The path of a URI without an authority must not start with two slashes \"//\"");
    }
    if (scheme.empty() && path.substr(0, path.find('/')).find(':') != std::string::npos) {
      throw invalid_state("A relative URI must not have a path beginning with a segment containing a colon");
    }
  } else if (!path.empty() && path.front() != '/') {
    NotifyUriDeprecation(
        "The path of a URI with an authority must start with a slash \"/\" or be empty. "
        "Automatically fixing the URI by adding a leading slash to the path is deprecated.");
    path.insert(path.begin(), '/');
  }
}

Uri::Uri() {
  static const auto kEmptyRep = std::make_shared<const Rep>();
  _rep = kEmptyRep;
}

Uri::Uri(std::string_view uri, AuxiliaryParams auxiliaryParams) {
  auto rep = std::make_shared<Rep>();
  if (!auxiliaryParams.empty()) {
    rep->auxiliaryParams = std::make_shared<const AuxiliaryParams>(std::move(auxiliaryParams));
  }

  if (uri.empty()) {
    rep->applyAuxiliaryParams();
    rep->normalize();
  } else {
    const std::optional<UriParts> parts = SplitUri(uri);
    if (!parts) {
      log::debug("Unable to split URI '{}'", uri);
      throw malformed_uri("Unable to parse URI: {}", uri);
    }
    try {
      rep->applyParts(*parts);
      rep->normalize();
    } catch (const invalid_argument &ex) {
      log::debug("Invalid URI '{}': {}", uri, ex.what());
      throw malformed_uri("Unable to parse URI: {}", ex.what());
    }
  }

  _rep = std::move(rep);
}

Uri Uri::fromParts(const UriParts &parts) {
  auto rep = std::make_shared<Rep>();
  rep->applyParts(parts);
  rep->normalize();
  return Uri(std::shared_ptr<const Rep>(std::move(rep)));
}

std::string Uri::ComposeComponents(std::string_view scheme, std::string_view authority, std::string_view path,
                                   std::string_view query, std::string_view fragment) {
  std::string uri;
  uri.reserve(scheme.size() + authority.size() + path.size() + query.size() + fragment.size() + 5UL);

  if (!scheme.empty()) {
    uri.append(scheme);
    uri.push_back(':');
  }
  if (!authority.empty() || scheme == "file") {
    uri.append("//");
    uri.append(authority);
  }

  uri.append(path);

  if (!query.empty()) {
    uri.push_back('?');
    uri.append(query);
  }
  if (!fragment.empty()) {
    uri.push_back('#');
    uri.append(fragment);
  }

  return uri;
}

const AuxiliaryParams &Uri::auxiliaryParams() const noexcept {
  return _rep->auxiliaryParams ? *_rep->auxiliaryParams : kEmptyAuxiliaryParams;
}

bool Uri::isDefaultPort() const noexcept { return !_rep->port || _rep->port == SchemeDefaultPortOf(_rep->scheme); }

uint16_t Uri::defaultPort() const noexcept { return SchemeDefaultPortOf(_rep->scheme).value_or(0); }

std::string Uri::str() const {
  return ComposeComponents(_rep->scheme, _rep->authority(), _rep->path, _rep->query, _rep->fragment);
}

template <class Func>
Uri Uri::withUpdatedRep(Func updateFunc) const {
  auto rep = std::make_shared<Rep>(*_rep);
  updateFunc(*rep);
  rep->normalize();
  return Uri(std::shared_ptr<const Rep>(std::move(rep)));
}

Uri Uri::withScheme(std::string_view scheme) const {
  std::string filtered = FilterScheme(scheme);
  if (filtered == _rep->scheme) {
    return *this;
  }
  return withUpdatedRep([&filtered](Rep &rep) {
    rep.scheme = std::move(filtered);
    rep.removeDefaultPort();
  });
}

Uri Uri::withUserInfo(std::string_view user, std::optional<std::string_view> password) const {
  std::string info = FilterUserInfoComponent(user);
  if (password && !password->empty()) {
    info.push_back(':');
    info.append(FilterUserInfoComponent(*password));
  }
  if (info == _rep->userInfo) {
    return *this;
  }
  return withUpdatedRep([&info](Rep &rep) { rep.userInfo = std::move(info); });
}

Uri Uri::withHost(std::string_view host) const {
  std::string filtered = FilterHost(host);
  if (filtered.empty() && RequiresHost(_rep->scheme)) {
    filtered = kHttpDefaultHost;
  }
  if (filtered == _rep->host) {
    return *this;
  }
  return withUpdatedRep([&filtered](Rep &rep) { rep.host = std::move(filtered); });
}

Uri Uri::withPort(std::optional<int> port) const {
  std::optional<uint16_t> filtered = FilterPort(port);
  if (filtered && filtered == SchemeDefaultPortOf(_rep->scheme)) {
    filtered.reset();
  }
  if (filtered == _rep->port) {
    return *this;
  }
  return withUpdatedRep([filtered](Rep &rep) { rep.port = filtered; });
}

Uri Uri::withPath(std::string_view path) const {
  std::string filtered = FilterPath(path);
  if (filtered == _rep->path) {
    return *this;
  }
  return withUpdatedRep([&filtered](Rep &rep) { rep.path = std::move(filtered); });
}

Uri Uri::withQuery(std::string_view query) const {
  std::string filtered = FilterQueryOrFragment(query);
  if (filtered == _rep->query) {
    return *this;
  }
  return withUpdatedRep([&filtered](Rep &rep) { rep.query = std::move(filtered); });
}

Uri Uri::withFragment(std::string_view fragment) const {
  std::string filtered = FilterQueryOrFragment(fragment);
  if (filtered == _rep->fragment) {
    return *this;
  }
  return withUpdatedRep([&filtered](Rep &rep) { rep.fragment = std::move(filtered); });
}

bool Uri::operator==(const Uri &other) const noexcept {
  if (isSameInstance(other)) {
    return true;
  }
  const Rep &lhs = *_rep;
  const Rep &rhs = *other._rep;
  return lhs.scheme == rhs.scheme && lhs.userInfo == rhs.userInfo && lhs.host == rhs.host && lhs.port == rhs.port &&
         lhs.path == rhs.path && lhs.query == rhs.query && lhs.fragment == rhs.fragment;
}

std::ostream &operator<<(std::ostream &os, const Uri &uri) { return os << uri.str(); }

}  // namespace urikit
