#include "urikit/uri-deprecation.hpp"

#include <mutex>
#include <string_view>
#include <utility>

#include "urikit/log.hpp"

namespace urikit {

namespace {

struct DeprecationHandlerSlot {
  std::mutex mutex;
  UriDeprecationHandler handler{[](std::string_view message) { log::warn("{}", message); }};
};

DeprecationHandlerSlot &GetDeprecationHandlerSlot() {
  static DeprecationHandlerSlot slot;
  return slot;
}

}  // namespace

UriDeprecationHandler SetUriDeprecationHandler(UriDeprecationHandler handler) {
  auto &slot = GetDeprecationHandlerSlot();
  std::lock_guard<std::mutex> lock(slot.mutex);
  return std::exchange(slot.handler, std::move(handler));
}

void NotifyUriDeprecation(std::string_view message) {
  UriDeprecationHandler handler;
  {
    auto &slot = GetDeprecationHandlerSlot();
    std::lock_guard<std::mutex> lock(slot.mutex);
    handler = slot.handler;
  }
  // called outside of the lock so that the handler may install another one
  if (handler) {
    handler(message);
  }
}

}  // namespace urikit
