#ifndef DESKBRIDGE_BRIDGE_EVENT_CHANNEL_H_
#define DESKBRIDGE_BRIDGE_EVENT_CHANNEL_H_

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "deskbridge/bridge/execution_backend.h"
#include "deskbridge/bridge/subscription.h"

namespace deskbridge {
namespace bridge {

// Subscribes to host push-events (or their in-process stand-ins).
//
// Events reach handlers in transport order with no buffering. Any number of
// handlers may share an event name; each gets its own Subscription, and a
// handler is never called once its Subscription has been cancelled.
class EventChannel {
 public:
  using Handler = std::function<void(const nlohmann::json& payload)>;

  explicit EventChannel(ExecutionBackend& backend);

  Subscription Subscribe(const std::string& event, Handler handler);

  ExecutionMode Mode() const { return backend_.Mode(); }

 private:
  ExecutionBackend& backend_;
};

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_EVENT_CHANNEL_H_
