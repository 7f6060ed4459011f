#ifndef DESKBRIDGE_BRIDGE_LISTENER_REGISTRY_H_
#define DESKBRIDGE_BRIDGE_LISTENER_REGISTRY_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "deskbridge/bridge/host.h"

namespace deskbridge {
namespace bridge {

// Event-name keyed listener table. Not thread-safe: registration, removal
// and delivery all happen on the thread that pumps events.
class ListenerRegistry {
 public:
  using ListenerId = Host::ListenerId;

  ListenerId Add(const std::string& event, Host::EventHandler handler);
  bool Remove(ListenerId id);

  // Calls every listener of `event` in registration order. A listener
  // removed by an earlier listener during the same delivery is skipped.
  // Returns the number of listeners invoked.
  size_t Deliver(const std::string& event, const nlohmann::json& payload);

  size_t Count(const std::string& event) const;
  size_t Size() const { return listeners_.size(); }

 private:
  struct Listener {
    std::string event;
    std::shared_ptr<Host::EventHandler> handler;
  };

  // Ordered by id, which is registration order.
  std::map<ListenerId, Listener> listeners_;
  ListenerId next_id_ = 1;
};

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_LISTENER_REGISTRY_H_
