#pragma once

#include <array>
#include <string>

namespace deskbridge {
namespace shell {

enum class Page { Kube, Dock, Settings, Logs };

enum class DockActionKind { None, SetProgress, SetBadge, ClearProgress, ClearBadge, RunTest };

struct DockAction {
  DockActionKind kind = DockActionKind::None;
  float progress = 0.0f;  // fraction, for SetProgress
  std::string badge;      // for SetBadge
};

struct Notice {
  std::string text;
  bool is_error = false;
  double shown_at = 0.0;
};

// Widget-local buffers and selections. Shell-wide flags live in
// deskbridge::core::UiState.
struct ViewState {
  Page current_page = Page::Kube;

  // Dock page
  int progress_slider = 0;  // percent
  std::array<char, 64> badge_input{};

  // Settings page
  std::array<char, 128> title_input{};

  // Logs page
  bool log_auto_scroll = true;
  std::array<char, 128> log_filter{};

  Notice notice;
};

} // namespace shell
} // namespace deskbridge
