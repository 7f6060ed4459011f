#include "deskbridge/bridge/event_channel.h"

#include <memory>
#include <utility>

#include "absl/strings/str_cat.h"
#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace bridge {

EventChannel::EventChannel(ExecutionBackend& backend) : backend_(backend) {}

Subscription EventChannel::Subscribe(const std::string& event,
                                     Handler handler) {
  // The transport may still hold a delivery for us after Cancel(); the flag
  // keeps the handler from seeing it.
  auto alive = std::make_shared<bool>(true);
  Subscription transport = backend_.Listen(
      event, [alive, handler = std::move(handler)](const nlohmann::json& payload) {
        if (*alive && handler) handler(payload);
      });

  DESKBRIDGE_LOG_DEBUG(absl::StrCat("subscribe event:", event, " mode:",
                                    ExecutionModeName(backend_.Mode())));

  auto registration = std::make_shared<Subscription>(std::move(transport));
  return Subscription([alive, registration, event]() {
    *alive = false;
    registration->Cancel();
    DESKBRIDGE_LOG_DEBUG(absl::StrCat("unsubscribe event:", event));
  });
}

}  // namespace bridge
}  // namespace deskbridge
