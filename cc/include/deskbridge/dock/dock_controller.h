#ifndef DESKBRIDGE_DOCK_DOCK_CONTROLLER_H_
#define DESKBRIDGE_DOCK_DOCK_CONTROLLER_H_

#include <string>

#include "deskbridge/bridge/execution_bridge.h"

namespace deskbridge {
namespace dock {

// Host commands that change the dock tile. The resulting state comes back
// as dock events, not through these callbacks. With an empty callback a
// failure is logged.
class DockController {
 public:
  static constexpr const char* kSetProgressCommand = "set_dock_progress";
  static constexpr const char* kSetBadgeCommand = "set_dock_badge";
  static constexpr const char* kClearProgressCommand = "clear_dock";
  static constexpr const char* kClearBadgeCommand = "clear_dock_badge";
  static constexpr const char* kTestProgressCommand = "test_dock_progress";

  explicit DockController(bridge::ExecutionBridge& bridge);

  // Values outside [0, 1] fail locally without reaching the host.
  void SetProgress(double fraction,
                   bridge::ExecutionBridge::Callback done = nullptr);
  void SetBadge(const std::string& label,
                bridge::ExecutionBridge::Callback done = nullptr);
  void ClearProgress(bridge::ExecutionBridge::Callback done = nullptr);
  void ClearBadge(bridge::ExecutionBridge::Callback done = nullptr);
  // Host-side 0..100% animation.
  void RunTestAnimation(bridge::ExecutionBridge::Callback done = nullptr);

 private:
  void Send(const char* command, const nlohmann::json& args,
            const char* failure_notice, bridge::ExecutionBridge::Callback done);

  bridge::ExecutionBridge& bridge_;
};

}  // namespace dock
}  // namespace deskbridge

#endif  // DESKBRIDGE_DOCK_DOCK_CONTROLLER_H_
