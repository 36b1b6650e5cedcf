#include <urikit/http-request.hpp>
#include <urikit/invalid_argument_exception.hpp>
#include <urikit/uri-query.hpp>
#include <urikit/uri.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string_view>

using namespace urikit;

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <uri> [query-key] [query-value]\n";
    return EXIT_FAILURE;
  }

  try {
    Uri uri(argv[1]);
    if (argc > 2) {
      uri = WithQueryValue(uri, argv[2], argc > 3 ? std::optional<std::string_view>(argv[3]) : std::nullopt);
    }

    std::cout << "uri:       " << uri << '\n';
    std::cout << "scheme:    " << uri.scheme() << '\n';
    std::cout << "authority: " << uri.authority() << '\n';
    std::cout << "userinfo:  " << uri.userInfo() << '\n';
    std::cout << "host:      " << uri.host() << '\n';
    std::cout << "port:      " << uri.port().value_or(uri.defaultPort());
    std::cout << (uri.isDefaultPort() ? " (default)\n" : "\n");
    std::cout << "path:      " << uri.path() << '\n';
    std::cout << "query:     " << uri.query() << '\n';
    std::cout << "fragment:  " << uri.fragment() << '\n';

    http::HttpRequest req(http::Method::GET, uri);
    std::cout << '\n' << req.methodStr() << ' ' << req.requestTarget() << " HTTP/" << req.protocolVersion() << '\n';
    for (const auto &field : req.headers().fields()) {
      std::cout << field.name << ": " << req.headerLine(field.name) << '\n';
    }
  } catch (const invalid_argument &ex) {
    std::cerr << "Invalid URI: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
