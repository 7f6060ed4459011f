#ifndef DESKBRIDGE_BRIDGE_EXECUTION_BACKEND_H_
#define DESKBRIDGE_BRIDGE_EXECUTION_BACKEND_H_

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "deskbridge/bridge/host.h"
#include "deskbridge/bridge/listener_registry.h"
#include "deskbridge/bridge/subscription.h"

namespace deskbridge {
namespace bridge {

enum class ExecutionMode { kNative, kStandalone };

const char* ExecutionModeName(ExecutionMode mode);

// Where commands and events go. Chosen once at startup and shared by the
// ExecutionBridge and the EventChannel.
class ExecutionBackend {
 public:
  virtual ~ExecutionBackend() = default;

  virtual ExecutionMode Mode() const = 0;
  virtual void Dispatch(const std::string& command, const nlohmann::json& args,
                        Host::ReplyCallback done) = 0;
  virtual Subscription Listen(const std::string& event,
                              Host::EventHandler handler) = 0;
};

// Forwards everything to a host process.
class NativeBackend : public ExecutionBackend {
 public:
  explicit NativeBackend(std::shared_ptr<Host> host);

  ExecutionMode Mode() const override { return ExecutionMode::kNative; }
  void Dispatch(const std::string& command, const nlohmann::json& args,
                Host::ReplyCallback done) override;
  Subscription Listen(const std::string& event,
                      Host::EventHandler handler) override;

 private:
  std::shared_ptr<Host> host_;
};

// No host: every command succeeds at once with null, and events come only
// from Emit() on this process.
class StandaloneBackend : public ExecutionBackend {
 public:
  StandaloneBackend();

  ExecutionMode Mode() const override { return ExecutionMode::kStandalone; }
  void Dispatch(const std::string& command, const nlohmann::json& args,
                Host::ReplyCallback done) override;
  Subscription Listen(const std::string& event,
                      Host::EventHandler handler) override;

  // Simulates a host push-event. Returns the number of handlers reached.
  size_t Emit(const std::string& event, const nlohmann::json& payload);

 private:
  std::shared_ptr<ListenerRegistry> listeners_;
};

// Native requires a host; a Native request without one falls back to
// Standalone with a warning.
std::unique_ptr<ExecutionBackend> MakeBackend(ExecutionMode mode,
                                              std::shared_ptr<Host> host);

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_EXECUTION_BACKEND_H_
