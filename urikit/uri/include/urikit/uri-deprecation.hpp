#pragma once

#include <functional>
#include <string_view>

namespace urikit {

// Receives non fatal diagnostics about deprecated URI forms that are silently normalized
// (for instance a relative path combined with an authority).
using UriDeprecationHandler = std::function<void(std::string_view)>;

// Installs a process wide deprecation handler and returns the previous one.
// The default handler logs a warning. An empty handler silences the diagnostics.
UriDeprecationHandler SetUriDeprecationHandler(UriDeprecationHandler handler);

// Forwards 'message' to the currently installed deprecation handler, if any.
void NotifyUriDeprecation(std::string_view message);

}  // namespace urikit
