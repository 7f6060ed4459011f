#include "deskbridge/bridge/listener_registry.h"

#include <utility>
#include <vector>

namespace deskbridge {
namespace bridge {

ListenerRegistry::ListenerId ListenerRegistry::Add(const std::string& event,
                                                   Host::EventHandler handler) {
  ListenerId id = next_id_++;
  listeners_[id] = Listener{
      event, std::make_shared<Host::EventHandler>(std::move(handler))};
  return id;
}

bool ListenerRegistry::Remove(ListenerId id) {
  return listeners_.erase(id) > 0;
}

size_t ListenerRegistry::Deliver(const std::string& event,
                                 const nlohmann::json& payload) {
  std::vector<ListenerId> targets;
  for (const auto& [id, listener] : listeners_) {
    if (listener.event == event) targets.push_back(id);
  }

  size_t delivered = 0;
  for (ListenerId id : targets) {
    auto it = listeners_.find(id);
    if (it == listeners_.end()) continue;
    // Hold the handler so it survives its own removal mid-call.
    std::shared_ptr<Host::EventHandler> handler = it->second.handler;
    if (*handler) {
      (*handler)(payload);
      ++delivered;
    }
  }
  return delivered;
}

size_t ListenerRegistry::Count(const std::string& event) const {
  size_t count = 0;
  for (const auto& [id, listener] : listeners_) {
    if (listener.event == event) ++count;
  }
  return count;
}

}  // namespace bridge
}  // namespace deskbridge
