#include "deskbridge/dock/dock_controller.h"

#include <utility>

#include "absl/strings/str_format.h"
#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace dock {

DockController::DockController(bridge::ExecutionBridge& bridge)
    : bridge_(bridge) {}

void DockController::SetProgress(double fraction,
                                 bridge::ExecutionBridge::Callback done) {
  if (!(fraction >= 0.0 && fraction <= 1.0)) {
    bridge::CommandError error = bridge::CommandError::HostFailure(
        absl::StrFormat("Invalid progress %g: must be between 0.0 and 1.0",
                        fraction));
    DESKBRIDGE_LOG_ERROR(error.message);
    if (done) done(bridge::InvokeResult::Failure(std::move(error)));
    return;
  }
  Send(kSetProgressCommand, {{"progress", fraction}},
       "Failed to set dock progress", std::move(done));
}

void DockController::SetBadge(const std::string& label,
                              bridge::ExecutionBridge::Callback done) {
  Send(kSetBadgeCommand, {{"label", label}}, "Failed to set dock badge",
       std::move(done));
}

void DockController::ClearProgress(bridge::ExecutionBridge::Callback done) {
  Send(kClearProgressCommand, nlohmann::json::object(),
       "Failed to clear dock progress", std::move(done));
}

void DockController::ClearBadge(bridge::ExecutionBridge::Callback done) {
  Send(kClearBadgeCommand, nlohmann::json::object(),
       "Failed to clear dock badge", std::move(done));
}

void DockController::RunTestAnimation(bridge::ExecutionBridge::Callback done) {
  Send(kTestProgressCommand, nlohmann::json::object(),
       "Failed to run dock progress test", std::move(done));
}

void DockController::Send(const char* command, const nlohmann::json& args,
                          const char* failure_notice,
                          bridge::ExecutionBridge::Callback done) {
  bridge_.Invoke(command, args,
                 [failure_notice, done = std::move(done)](
                     const bridge::InvokeResult& result) {
                   if (done) {
                     done(result);
                     return;
                   }
                   if (!result.ok) {
                     DESKBRIDGE_LOG_ERROR(absl::StrFormat(
                         "%s: %s", failure_notice, result.error.message));
                   }
                 });
}

}  // namespace dock
}  // namespace deskbridge
