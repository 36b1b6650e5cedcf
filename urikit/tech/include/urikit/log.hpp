#pragma once

// Logging abstraction over spdlog.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace urikit {

namespace log = spdlog;

}  // namespace urikit
