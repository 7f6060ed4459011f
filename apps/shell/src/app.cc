#include "app.h"

#include <chrono>
#include <cstdio>

#define GL_SILENCE_DEPRECATION
#include <GLFW/glfw3.h>
#include <imgui.h>

#include "absl/strings/str_cat.h"
#include "deskbridge/bridge/process_host.h"
#include "deskbridge/core/filesystem.h"
#include "deskbridge/core/logger.h"
#include "ui/panels.h"

namespace deskbridge {
namespace shell {

namespace {
constexpr const char* kAppName = "deskbridge";
}  // namespace

App::App(const deskbridge::core::ShellConfig& config) : config_(config) {
  using deskbridge::core::FileSystem;

  bridge::ExecutionMode mode = deskbridge::core::SelectExecutionMode(config_);
  if (mode == bridge::ExecutionMode::kNative && !config_.host_helper.empty()) {
    host_ = std::make_shared<bridge::ProcessHost>(
        FileSystem::ResolvePath(config_.host_helper).string(), queue_);
  }
  backend_ = bridge::MakeBackend(mode, host_);
  standalone_ = dynamic_cast<bridge::StandaloneBackend*>(backend_.get());

  bridge_ = std::make_unique<bridge::ExecutionBridge>(*backend_);
  channel_ = std::make_unique<bridge::EventChannel>(*backend_);
  loader_ = std::make_unique<kube::ConfigLoader>(*bridge_);
  kube_store_ = std::make_unique<kube::KubeStore>(*loader_, config_.kubeconfig);
  refresh_ = std::make_unique<kube::RefreshDebouncer>(
      std::chrono::milliseconds(config_.refresh_debounce_ms), [this]() {
        kube_store_->Refresh([this](const kube::ConfigLoader::LoadResult& result) {
          if (result.ok) {
            DESKBRIDGE_LOG_INFO(absl::StrCat(
                "Loaded ", result.config.clusters.size(), " clusters, current context: ",
                result.config.current_context.value_or("<unset>")));
          } else {
            ShowNotice(result.error.message, true);
          }
        });
      });

  dock_sync_ = std::make_unique<dock::DockSynchronizer>(*channel_, dock_state_);
  dock_sync_->Start();
  dock_controller_ = std::make_unique<dock::DockController>(*bridge_);

  context_ = std::make_unique<core::GraphicsContext>(kAppName, 1100, 720);
  if (context_->IsValid()) {
    ApplyTheme();
  } else {
    DESKBRIDGE_LOG_ERROR("Failed to initialize graphics context");
  }
}

App::~App() {
  dock_sync_->Stop();
}

int App::Run() {
  if (!context_ || !context_->IsValid()) return 1;

  refresh_->Trigger();

  while (!context_->ShouldClose()) {
    context_->PollEvents();
    now_ = glfwGetTime();
    Tick();

    context_->BeginFrame();
    RenderFrame(now_);
    context_->EndFrame(ui_state_.IsDarkMode());
  }
  return 0;
}

void App::Tick() {
  queue_.Pump();
  refresh_->Poll();
  SyncViewFromDock();

  if (applied_dark_mode_ != ui_state_.IsDarkMode()) ApplyTheme();
  context_->SetTitle(ui_state_.WindowTitle(kAppName));
}

void App::RenderFrame(double now) {
  const ImGuiViewport* viewport = ImGui::GetMainViewport();
  ImGui::SetNextWindowPos(viewport->WorkPos);
  ImGui::SetNextWindowSize(viewport->WorkSize);
  ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                           ImGuiWindowFlags_NoSavedSettings |
                           ImGuiWindowFlags_NoBringToFrontOnFocus;
  ImGui::Begin("##Shell", nullptr, flags);

  ui::RenderSidebar(view_, ui_state_, backend_->Mode());
  ImGui::SameLine();

  ImGui::BeginChild("Page", ImVec2(0, 0), false);
  switch (view_.current_page) {
    case Page::Kube:
      ui::RenderKubePanel(*kube_store_, *refresh_);
      break;
    case Page::Dock:
      HandleDockAction(ui::RenderDockPanel(dock_state_, view_));
      break;
    case Page::Settings:
      ui::RenderSettingsPanel(ui_state_, view_);
      break;
    case Page::Logs:
      ui::RenderLogPanel(view_);
      break;
  }
  ImGui::EndChild();
  ImGui::End();

  ui::RenderNotice(view_.notice, now);
}

void App::HandleDockAction(const DockAction& action) {
  auto on_result = [this](const char* failure, const char* event, nlohmann::json payload) {
    return [this, failure, event, payload](const bridge::InvokeResult& result) {
      if (!result.ok) {
        DESKBRIDGE_LOG_ERROR(absl::StrCat(failure, ": ", result.error.message));
        ShowNotice(failure, true);
        return;
      }
      if (event) SimulateHostEvent(event, payload);
    };
  };

  switch (action.kind) {
    case DockActionKind::None:
      return;
    case DockActionKind::SetProgress:
      dock_controller_->SetProgress(
          action.progress,
          on_result("Failed to set dock progress", dock::DockSynchronizer::kProgressEvent,
                    {{"progress", action.progress}}));
      return;
    case DockActionKind::SetBadge:
      dock_controller_->SetBadge(
          action.badge, on_result("Failed to set dock badge", dock::DockSynchronizer::kBadgeEvent,
                                  {{"badge", action.badge}}));
      return;
    case DockActionKind::ClearProgress:
      dock_controller_->ClearProgress(
          on_result("Failed to clear dock progress", dock::DockSynchronizer::kProgressEvent,
                    {{"progress", nullptr}}));
      return;
    case DockActionKind::ClearBadge:
      dock_controller_->ClearBadge(
          on_result("Failed to clear dock badge", dock::DockSynchronizer::kBadgeEvent,
                    {{"badge", nullptr}}));
      return;
    case DockActionKind::RunTest:
      dock_controller_->RunTestAnimation(
          on_result("Failed to run dock progress test", nullptr, nullptr));
      return;
  }
}

// Without a host nobody answers dock commands with events, so the shell
// emits what the host would have sent.
void App::SimulateHostEvent(const char* event, const nlohmann::json& payload) {
  if (!standalone_) return;
  standalone_->Emit(event, payload);
}

void App::SyncViewFromDock() {
  if (dock_state_ == last_seen_dock_) return;
  if (dock_state_.progress != last_seen_dock_.progress) {
    view_.progress_slider = dock_state_.ProgressPercent();
  }
  if (dock_state_.badge != last_seen_dock_.badge) {
    std::snprintf(view_.badge_input.data(), view_.badge_input.size(), "%s",
                  dock_state_.BadgeText().c_str());
  }
  last_seen_dock_ = dock_state_;
}

void App::ShowNotice(const std::string& text, bool is_error) {
  view_.notice = Notice{text, is_error, now_};
}

void App::ApplyTheme() {
  if (ui_state_.IsDarkMode()) {
    ImGui::StyleColorsDark();
  } else {
    ImGui::StyleColorsLight();
  }
  applied_dark_mode_ = ui_state_.IsDarkMode();
}

}  // namespace shell
}  // namespace deskbridge
