#include "ui/panels.h"

#include <cstdio>
#include <string>
#include <vector>

#include "absl/strings/match.h"
#include "deskbridge/core/logger.h"
#include "deskbridge/kube/config_resolver.h"

namespace deskbridge {
namespace shell {
namespace ui {

namespace {

constexpr double kNoticeSeconds = 4.0;

ImVec4 LevelColor(deskbridge::core::LogLevel level) {
  switch (level) {
    case deskbridge::core::LogLevel::kError: return ImVec4(0.95f, 0.40f, 0.40f, 1.0f);
    case deskbridge::core::LogLevel::kWarn:  return ImVec4(0.95f, 0.75f, 0.35f, 1.0f);
    case deskbridge::core::LogLevel::kDebug:
    case deskbridge::core::LogLevel::kTrace: return ImVec4(0.55f, 0.55f, 0.60f, 1.0f);
    default: return ImGui::GetStyleColorVec4(ImGuiCol_Text);
  }
}

void LabeledValue(const char* label, const std::string& value) {
  ImGui::TextDisabled("%s", label);
  ImGui::SameLine(90.0f);
  ImGui::TextUnformatted(value.empty() ? "-" : value.c_str());
}

void RenderUserDetails(const kube::NamedUser& user) {
  const kube::UserInfo& info = user.user;
  LabeledValue("Auth", kube::CredentialKindName(info.Kind()));
  if (info.exec) {
    std::string command = info.exec->command;
    for (const auto& arg : info.exec->args) command += " " + arg;
    LabeledValue("Command", command);
    for (const auto& var : info.exec->env) {
      ImGui::BulletText("%s: %s", var.name.c_str(), var.value.c_str());
    }
  }
  if (info.client_certificate) LabeledValue("Cert", *info.client_certificate);
  if (info.client_key) LabeledValue("Key", *info.client_key);
}

} // namespace

void HelpMarker(const char* desc) {
  ImGui::TextDisabled("(?)");
  if (ImGui::IsItemHovered()) {
    ImGui::BeginTooltip();
    ImGui::PushTextWrapPos(ImGui::GetFontSize() * 35.0f);
    ImGui::TextUnformatted(desc);
    ImGui::PopTextWrapPos();
    ImGui::EndTooltip();
  }
}

void RenderSidebar(ViewState& view, deskbridge::core::UiState& ui_state, bridge::ExecutionMode mode) {
  const float width = ui_state.IsSidebarCollapsed() ? 56.0f : 150.0f;
  ImGui::BeginChild("Sidebar", ImVec2(width, 0), true);

  struct Entry { Page page; const char* label; const char* short_label; };
  static const Entry kEntries[] = {
      {Page::Kube, "Kubernetes", "K8s"},
      {Page::Dock, "Dock", "Dock"},
      {Page::Settings, "Settings", "Set"},
      {Page::Logs, "Logs", "Log"},
  };
  for (const auto& entry : kEntries) {
    const char* label = ui_state.IsSidebarCollapsed() ? entry.short_label : entry.label;
    if (ImGui::Selectable(label, view.current_page == entry.page)) {
      view.current_page = entry.page;
    }
  }

  ImGui::Separator();
  if (ui_state.IsCollapsible() &&
      ImGui::SmallButton(ui_state.IsSidebarCollapsed() ? ">>" : "<<")) {
    ui_state.SetSidebarCollapsed(!ui_state.IsSidebarCollapsed());
  }
  ImGui::TextDisabled("%s", bridge::ExecutionModeName(mode));
  ImGui::EndChild();
}

void RenderKubePanel(kube::KubeStore& store, kube::RefreshDebouncer& refresh) {
  ImGui::Text("Kubernetes");
  ImGui::SameLine();
  if (ImGui::Button(store.IsLoading() ? "Loading..." : "Refresh")) {
    refresh.Trigger();
  }
  ImGui::SameLine();
  ImGui::TextDisabled("%s", store.GetPath().c_str());
  ImGui::Separator();

  const bridge::CommandError& error = store.GetLastError();
  if (error.IsError()) {
    ImGui::TextColored(ImVec4(0.9f, 0.4f, 0.4f, 1.0f), "[%s] %s",
                       error.Category(), error.message.c_str());
  }
  if (!store.HasDocument()) {
    ImGui::TextDisabled("No configuration loaded.");
    return;
  }

  const kube::KubeConfig& config = *store.GetDocument();
  const std::string active = store.ActiveContextName().value_or("");
  const kube::NamedContext* active_ctx = kube::FindContext(config, active);
  const std::string preview = active_ctx ? kube::ContextLabel(*active_ctx) : "Context";

  ImGui::SetNextItemWidth(320.0f);
  if (ImGui::BeginCombo("##Context", preview.c_str())) {
    for (const auto& ctx : config.contexts) {
      const bool selected = ctx.name == active;
      if (ImGui::Selectable(kube::ContextLabel(ctx).c_str(), selected)) {
        store.SelectContext(ctx.name);
      }
      if (selected) ImGui::SetItemDefaultFocus();
    }
    ImGui::EndCombo();
  }

  kube::Resolution resolved = store.Resolve();
  ImGui::Spacing();
  if (!resolved.HasContext()) {
    ImGui::TextDisabled("No context selected.");
    return;
  }

  LabeledValue("Context", resolved.context->name);
  ImGui::SameLine();
  ImGui::TextColored(ImVec4(0.40f, 0.65f, 0.95f, 1.0f), "(%s)",
                     resolved.EffectiveNamespace().c_str());

  if (resolved.cluster) {
    LabeledValue("Cluster", resolved.cluster->name);
    LabeledValue("Server", resolved.cluster->cluster.server);
  } else {
    LabeledValue("Cluster", "");
    ImGui::SameLine();
    HelpMarker("The context refers to a cluster that is not in this file.");
  }

  if (resolved.user) {
    LabeledValue("User", resolved.user->name);
    ImGui::Indent();
    RenderUserDetails(*resolved.user);
    ImGui::Unindent();
  } else {
    LabeledValue("User", "");
  }
}

DockAction RenderDockPanel(const dock::DockState& dock, ViewState& view) {
  DockAction action;

  ImGui::Text("Dock");
  ImGui::Separator();

  std::string progress_text = "None";
  if (dock.progress) {
    progress_text = std::to_string(dock.ProgressPercent()) + "%";
  }
  const std::string badge_text = dock.BadgeText();
  LabeledValue("Progress", progress_text);
  LabeledValue("Badge", badge_text.empty() ? "None" : badge_text);
  ImGui::Spacing();

  ImGui::SliderInt("Dock Progress", &view.progress_slider, 0, 100, "%d%%");
  // One command per drag gesture.
  if (ImGui::IsItemDeactivatedAfterEdit()) {
    action.kind = DockActionKind::SetProgress;
    action.progress = static_cast<float>(view.progress_slider) / 100.0f;
  }

  ImGui::SetNextItemWidth(220.0f);
  ImGui::InputTextWithHint("##Badge", "Enter badge text", view.badge_input.data(),
                           view.badge_input.size());
  ImGui::SameLine();
  if (ImGui::Button("Set Badge")) {
    action.kind = DockActionKind::SetBadge;
    action.badge = view.badge_input.data();
  }

  if (ImGui::Button("Clear Progress")) action.kind = DockActionKind::ClearProgress;
  ImGui::SameLine();
  if (ImGui::Button("Clear Badge")) action.kind = DockActionKind::ClearBadge;
  ImGui::SameLine();
  if (ImGui::Button("Test Progress")) action.kind = DockActionKind::RunTest;

  return action;
}

void RenderSettingsPanel(deskbridge::core::UiState& ui_state, ViewState& view) {
  ImGui::Text("Settings");
  ImGui::Separator();

  bool dark = ui_state.IsDarkMode();
  if (ImGui::Checkbox("Dark mode", &dark)) {
    ui_state.SetDarkMode(dark);
  }

  bool collapsible = ui_state.IsCollapsible();
  if (ImGui::Checkbox("Collapsible sidebar", &collapsible)) {
    ui_state.SetCollapsible(collapsible);
  }

  ImGui::SetNextItemWidth(260.0f);
  if (ImGui::InputTextWithHint("Title", "Window title", view.title_input.data(),
                               view.title_input.size(),
                               ImGuiInputTextFlags_EnterReturnsTrue)) {
    ui_state.SetTitle(view.title_input.data());
  }

  ImGui::Spacing();
  auto& logger = deskbridge::core::Logger::GetInstance();
  static const char* kLevels[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};
  int level = static_cast<int>(logger.GetMinLevel());
  ImGui::SetNextItemWidth(140.0f);
  if (ImGui::Combo("Log level", &level, kLevels, IM_ARRAYSIZE(kLevels))) {
    logger.SetMinLevel(static_cast<deskbridge::core::LogLevel>(level));
  }
}

void RenderLogPanel(ViewState& view) {
  auto& logger = deskbridge::core::Logger::GetInstance();
  ImGui::Text("Logs");
  ImGui::SameLine();
  if (ImGui::SmallButton("Clear")) logger.Clear();
  ImGui::SameLine();
  ImGui::Checkbox("Auto-scroll", &view.log_auto_scroll);
  ImGui::SetNextItemWidth(240.0f);
  ImGui::InputTextWithHint("##LogFilter", "Filter", view.log_filter.data(),
                           view.log_filter.size());
  ImGui::Separator();

  const std::string filter(view.log_filter.data());
  std::vector<deskbridge::core::LogEntry> entries = logger.GetEntries();
  ImGui::BeginChild("LogScroll", ImVec2(0, 0), true);
  for (const auto& entry : entries) {
    if (!filter.empty() && !absl::StrContainsIgnoreCase(entry.message, filter)) {
      continue;
    }
    ImGui::TextDisabled("%s", entry.timestamp.c_str());
    ImGui::SameLine();
    ImGui::TextColored(LevelColor(entry.level), "%-5s",
                       deskbridge::core::Logger::LevelToString(entry.level));
    ImGui::SameLine();
    ImGui::TextUnformatted(entry.message.c_str());
  }
  if (view.log_auto_scroll && ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) {
    ImGui::SetScrollHereY(1.0f);
  }
  ImGui::EndChild();
}

void RenderNotice(const Notice& notice, double now) {
  if (notice.text.empty() || now - notice.shown_at > kNoticeSeconds) return;

  const ImGuiViewport* viewport = ImGui::GetMainViewport();
  ImVec2 pos(viewport->WorkPos.x + viewport->WorkSize.x - 12.0f,
             viewport->WorkPos.y + viewport->WorkSize.y - 12.0f);
  ImGui::SetNextWindowPos(pos, ImGuiCond_Always, ImVec2(1.0f, 1.0f));
  ImGui::SetNextWindowBgAlpha(0.9f);
  ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize |
                           ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoFocusOnAppearing |
                           ImGuiWindowFlags_NoNav;
  if (ImGui::Begin("##Notice", nullptr, flags)) {
    if (notice.is_error) {
      ImGui::TextColored(ImVec4(0.95f, 0.40f, 0.40f, 1.0f), "%s", notice.text.c_str());
    } else {
      ImGui::TextUnformatted(notice.text.c_str());
    }
  }
  ImGui::End();
}

} // namespace ui
} // namespace shell
} // namespace deskbridge
