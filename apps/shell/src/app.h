#pragma once

#include <memory>
#include <string>

#include "core/context.h"
#include "deskbridge/bridge/dispatch_queue.h"
#include "deskbridge/bridge/event_channel.h"
#include "deskbridge/bridge/execution_backend.h"
#include "deskbridge/bridge/execution_bridge.h"
#include "deskbridge/bridge/host.h"
#include "deskbridge/core/shell_config.h"
#include "deskbridge/core/ui_state.h"
#include "deskbridge/dock/dock_controller.h"
#include "deskbridge/dock/dock_state.h"
#include "deskbridge/dock/dock_synchronizer.h"
#include "deskbridge/kube/config_loader.h"
#include "deskbridge/kube/kube_store.h"
#include "deskbridge/kube/refresh_debouncer.h"
#include "models/state.h"

namespace deskbridge {
namespace shell {

/// Desktop shell window around the bridge, kube and dock cores.
class App {
 public:
  explicit App(const deskbridge::core::ShellConfig& config);
  ~App();

  /// Run the application main loop.
  int Run();

 private:
  void Tick();
  void RenderFrame(double now);
  void HandleDockAction(const DockAction& action);
  void SimulateHostEvent(const char* event, const nlohmann::json& payload);
  void SyncViewFromDock();
  void ShowNotice(const std::string& text, bool is_error);
  void ApplyTheme();

  deskbridge::core::ShellConfig config_;
  deskbridge::core::UiState ui_state_;
  dock::DockState dock_state_;
  dock::DockState last_seen_dock_;
  ViewState view_;
  bool applied_dark_mode_ = false;
  double now_ = 0.0;

  // Declaration order is teardown order in reverse: the queue outlives the
  // host that posts to it, and the host outlives every subscriber.
  bridge::DispatchQueue queue_;
  std::shared_ptr<bridge::Host> host_;
  std::unique_ptr<bridge::ExecutionBackend> backend_;
  bridge::StandaloneBackend* standalone_ = nullptr;
  std::unique_ptr<bridge::ExecutionBridge> bridge_;
  std::unique_ptr<bridge::EventChannel> channel_;
  std::unique_ptr<kube::ConfigLoader> loader_;
  std::unique_ptr<kube::KubeStore> kube_store_;
  std::unique_ptr<kube::RefreshDebouncer> refresh_;
  std::unique_ptr<dock::DockSynchronizer> dock_sync_;
  std::unique_ptr<dock::DockController> dock_controller_;

  std::unique_ptr<core::GraphicsContext> context_;
};

}  // namespace shell
}  // namespace deskbridge
