#include "deskbridge/bridge/execution_bridge.h"

#include <memory>
#include <utility>

#include "absl/strings/str_cat.h"
#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace bridge {

namespace {

// Host output is not guaranteed to be UTF-8; tracing must not throw on it.
std::string DumpForTrace(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

ExecutionBridge::ExecutionBridge(ExecutionBackend& backend)
    : backend_(backend) {}

void ExecutionBridge::Invoke(const std::string& command,
                             const nlohmann::json& args, Callback done) {
  const std::uint64_t call_id = next_call_id_++;
  const nlohmann::json call_args =
      args.is_null() ? nlohmann::json::object() : args;

  auto& logger = core::Logger::GetInstance();
  if (logger.IsEnabled(core::LogLevel::kTrace)) {
    logger.Trace(absl::StrCat("invoke #", call_id, " cmd:", command,
                              " args:", DumpForTrace(call_args)));
  }

  // Guards the at-most-once contract against hosts that answer twice.
  auto answered = std::make_shared<bool>(false);
  backend_.Dispatch(
      command, call_args,
      [command, call_id, answered, done = std::move(done)](
          const HostReply& reply) {
        if (*answered) {
          DESKBRIDGE_LOG_WARN(absl::StrCat("invoke #", call_id, " cmd:", command,
                                           " ignoring duplicate reply"));
          return;
        }
        *answered = true;

        InvokeResult result;
        if (reply.ok) {
          result = InvokeResult::Success(reply.value);
          auto& log = core::Logger::GetInstance();
          if (log.IsEnabled(core::LogLevel::kTrace)) {
            log.Trace(absl::StrCat("invoke #", call_id,
                                   " result:", DumpForTrace(reply.value)));
          }
        } else {
          result = InvokeResult::Failure(ClassifyHostFailure(command, reply.value));
          DESKBRIDGE_LOG_DEBUG(absl::StrCat(
              "invoke #", call_id, " cmd:", command, " failed [",
              result.error.Category(), "] ", result.error.message));
        }
        if (done) done(result);
      });
}

}  // namespace bridge
}  // namespace deskbridge
