#include "deskbridge/bridge/execution_backend.h"

#include <utility>

#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace bridge {

const char* ExecutionModeName(ExecutionMode mode) {
  switch (mode) {
    case ExecutionMode::kNative:     return "native";
    case ExecutionMode::kStandalone: return "standalone";
  }
  return "unknown";
}

NativeBackend::NativeBackend(std::shared_ptr<Host> host)
    : host_(std::move(host)) {}

void NativeBackend::Dispatch(const std::string& command,
                             const nlohmann::json& args,
                             Host::ReplyCallback done) {
  host_->Dispatch(command, args, std::move(done));
}

Subscription NativeBackend::Listen(const std::string& event,
                                   Host::EventHandler handler) {
  Host::ListenerId id = host_->Listen(event, std::move(handler));
  std::weak_ptr<Host> weak_host = host_;
  return Subscription([weak_host, id]() {
    if (auto host = weak_host.lock()) {
      host->Unlisten(id);
    }
  });
}

StandaloneBackend::StandaloneBackend()
    : listeners_(std::make_shared<ListenerRegistry>()) {}

void StandaloneBackend::Dispatch(const std::string& /*command*/,
                                 const nlohmann::json& /*args*/,
                                 Host::ReplyCallback done) {
  if (done) done(HostReply{true, nullptr});
}

Subscription StandaloneBackend::Listen(const std::string& event,
                                       Host::EventHandler handler) {
  ListenerRegistry::ListenerId id = listeners_->Add(event, std::move(handler));
  std::weak_ptr<ListenerRegistry> weak_listeners = listeners_;
  return Subscription([weak_listeners, id]() {
    if (auto listeners = weak_listeners.lock()) {
      listeners->Remove(id);
    }
  });
}

size_t StandaloneBackend::Emit(const std::string& event,
                               const nlohmann::json& payload) {
  return listeners_->Deliver(event, payload);
}

std::unique_ptr<ExecutionBackend> MakeBackend(ExecutionMode mode,
                                              std::shared_ptr<Host> host) {
  if (mode == ExecutionMode::kNative) {
    if (host) {
      DESKBRIDGE_LOG_INFO("Execution mode: native");
      return std::make_unique<NativeBackend>(std::move(host));
    }
    DESKBRIDGE_LOG_WARN("Native mode requested without a host; using standalone");
  }
  DESKBRIDGE_LOG_INFO("Execution mode: standalone");
  return std::make_unique<StandaloneBackend>();
}

}  // namespace bridge
}  // namespace deskbridge
