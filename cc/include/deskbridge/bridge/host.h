#ifndef DESKBRIDGE_BRIDGE_HOST_H_
#define DESKBRIDGE_BRIDGE_HOST_H_

#include <cstdint>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace deskbridge {
namespace bridge {

// What the host answered for one command. On failure `value` holds the
// host's error value (usually a message string).
struct HostReply {
  bool ok = false;
  nlohmann::json value;
};

// The privileged process that executes commands and pushes events.
// Implementations own their transport; the bridge only talks to this
// interface.
class Host {
 public:
  using ReplyCallback = std::function<void(const HostReply&)>;
  using EventHandler = std::function<void(const nlohmann::json& payload)>;
  using ListenerId = std::uint64_t;

  virtual ~Host() = default;

  // Runs `command`. `done` is called once, possibly later and from the
  // thread that pumps the host's delivery queue.
  virtual void Dispatch(const std::string& command, const nlohmann::json& args,
                        ReplyCallback done) = 0;

  virtual ListenerId Listen(const std::string& event, EventHandler handler) = 0;

  // Unknown or already removed ids are ignored.
  virtual void Unlisten(ListenerId id) = 0;
};

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_HOST_H_
