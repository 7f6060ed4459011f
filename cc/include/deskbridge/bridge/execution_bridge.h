#ifndef DESKBRIDGE_BRIDGE_EXECUTION_BRIDGE_H_
#define DESKBRIDGE_BRIDGE_EXECUTION_BRIDGE_H_

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "deskbridge/bridge/command_error.h"
#include "deskbridge/bridge/execution_backend.h"

namespace deskbridge {
namespace bridge {

// Sends named commands to the host and classifies failures.
//
// Every call is a single attempt: no retries and no timeout. A command the
// host never answers leaves its callback pending. Each call and outcome is
// written to the diagnostic log.
class ExecutionBridge {
 public:
  using Callback = std::function<void(const InvokeResult&)>;

  explicit ExecutionBridge(ExecutionBackend& backend);

  // `args` must be a JSON object (or null for no arguments). `done` runs at
  // most once and may be empty.
  void Invoke(const std::string& command, const nlohmann::json& args,
              Callback done);
  void Invoke(const std::string& command, Callback done) {
    Invoke(command, nlohmann::json::object(), std::move(done));
  }

  ExecutionMode Mode() const { return backend_.Mode(); }

 private:
  ExecutionBackend& backend_;
  std::uint64_t next_call_id_ = 1;
};

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_EXECUTION_BRIDGE_H_
