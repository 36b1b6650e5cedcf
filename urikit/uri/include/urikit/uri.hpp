#pragma once

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "urikit/uri-parts.hpp"

namespace urikit {

// Out of band values known before the URI itself (typically forwarded by a reverse proxy).
// Recognized keys: "path" and "query", used to fill a URI built from an empty string.
using AuxiliaryParams = std::map<std::string, std::string, std::less<>>;

// Immutable RFC 3986 URI reference.
//
// A Uri is a cheap to copy handle over an immutable, shared representation. All 'with' methods leave the
// current object untouched and return a new Uri. When the requested change is a no-op, the returned Uri
// shares the representation of the current one, which can be checked with isSameInstance().
//
// Components are stored normalized:
//   - scheme and host are lower case
//   - userinfo, path, query and fragment are percent-encoded, never twice
//   - the default port of the scheme is never stored (port() returns std::nullopt instead)
//   - "http" and "https" URIs without host get the host "localhost"
//
// str() recomposes the components, so it does not always give back the parsed string. An empty query,
// fragment or port loses its delimiter ("http://h?" gives "http://h"), and a "file" URI always gets the
// "//" delimiter ("file:/x" gives "file:///x").
//
// Construction and updates throw:
//   - malformed_uri if a raw string cannot be parsed
//   - invalid_argument if a single component is invalid (bad port, bad scheme syntax...)
//   - invalid_state if the combination of components breaks RFC 3986 structural rules
class Uri {
 public:
  static constexpr std::string_view kHttpDefaultHost = "localhost";

  // Creates an empty URI reference ("").
  Uri();

  // Parses given URI reference. Throws malformed_uri if it cannot be parsed.
  explicit Uri(std::string_view uri) : Uri(uri, AuxiliaryParams{}) {}

  // Parses given URI reference and keeps 'auxiliaryParams'.
  // If 'uri' is empty, path and query are taken from the "path" and "query" auxiliary parameters.
  Uri(std::string_view uri, AuxiliaryParams auxiliaryParams);

  static Uri parse(std::string_view uri) { return Uri(uri); }

  // Builds a Uri from pre-split components, applying the same normalization as parsing.
  // Throws invalid_argument (or its subclass invalid_state) if the result would not be valid.
  static Uri fromParts(const UriParts &parts);

  // Composes a URI reference string from its components (RFC 3986 §5.3).
  // Empty components are omitted, except that "//" is always emitted for the "file" scheme
  // to keep the canonical "file:///path" form.
  static std::string ComposeComponents(std::string_view scheme, std::string_view authority, std::string_view path,
                                       std::string_view query, std::string_view fragment);

  // Lower case scheme, empty if there is none. No scheme is assumed for relative references (no "http" default).
  [[nodiscard]] std::string_view scheme() const noexcept { return _rep->scheme; }

  // [userinfo "@"] host [":" port], with userinfo and port omitted when absent.
  [[nodiscard]] std::string authority() const { return _rep->authority(); }

  // "user[:password]", percent-encoded, empty if absent.
  [[nodiscard]] std::string_view userInfo() const noexcept { return _rep->userInfo; }

  // Lower case host, empty if absent.
  [[nodiscard]] std::string_view host() const noexcept { return _rep->host; }

  // Port if set and different from the default port of the scheme.
  [[nodiscard]] std::optional<uint16_t> port() const noexcept { return _rep->port; }

  [[nodiscard]] std::string_view path() const noexcept { return _rep->path; }

  // Query without the leading '?'.
  [[nodiscard]] std::string_view query() const noexcept { return _rep->query; }

  // Fragment without the leading '#'.
  [[nodiscard]] std::string_view fragment() const noexcept { return _rep->fragment; }

  [[nodiscard]] const AuxiliaryParams &auxiliaryParams() const noexcept;

  // Tells whether the URI uses the default port of its scheme (true as well when no port is set).
  [[nodiscard]] bool isDefaultPort() const noexcept;

  // Default port of the scheme, 0 if the scheme is unknown.
  [[nodiscard]] uint16_t defaultPort() const noexcept;

  // Full string representation.
  [[nodiscard]] std::string str() const;

  [[nodiscard]] Uri withScheme(std::string_view scheme) const;

  // Sets the userinfo to "user[:password]". An empty or absent password only keeps the user.
  [[nodiscard]] Uri withUserInfo(std::string_view user, std::optional<std::string_view> password = std::nullopt) const;

  [[nodiscard]] Uri withHost(std::string_view host) const;

  // Sets the port, std::nullopt removing it. The value must be in [1, 65535].
  [[nodiscard]] Uri withPort(std::optional<int> port) const;

  [[nodiscard]] Uri withPath(std::string_view path) const;

  [[nodiscard]] Uri withQuery(std::string_view query) const;

  [[nodiscard]] Uri withFragment(std::string_view fragment) const;

  // Tells whether both objects share the same representation.
  // A 'with' method returning a Uri for which isSameInstance(*this) is true did not change anything.
  [[nodiscard]] bool isSameInstance(const Uri &other) const noexcept { return _rep == other._rep; }

  // Compares all components. Auxiliary parameters are not taken into account.
  bool operator==(const Uri &other) const noexcept;

 private:
  struct Rep {
    [[nodiscard]] bool isAuthorityEmpty() const noexcept { return host.empty() && userInfo.empty() && !port; }

    [[nodiscard]] std::string authority() const;

    void applyParts(const UriParts &parts);

    void applyAuxiliaryParams();

    void removeDefaultPort() noexcept;

    // Enforces cross component rules, may fix the host and the path.
    // Throws invalid_state if the components cannot be combined.
    void normalize();

    std::string scheme;
    std::string userInfo;
    std::string host;
    std::optional<uint16_t> port;
    std::string path;
    std::string query;
    std::string fragment;
    std::shared_ptr<const AuxiliaryParams> auxiliaryParams;
  };

  explicit Uri(std::shared_ptr<const Rep> rep) noexcept : _rep(std::move(rep)) {}

  template <class Func>
  Uri withUpdatedRep(Func updateFunc) const;

  std::shared_ptr<const Rep> _rep;
};

std::ostream &operator<<(std::ostream &os, const Uri &uri);

}  // namespace urikit
