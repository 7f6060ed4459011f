#pragma once

#include <imgui.h>

#include "deskbridge/bridge/execution_backend.h"
#include "deskbridge/core/ui_state.h"
#include "deskbridge/dock/dock_state.h"
#include "deskbridge/kube/kube_store.h"
#include "deskbridge/kube/refresh_debouncer.h"
#include "models/state.h"

namespace deskbridge {
namespace shell {
namespace ui {

void HelpMarker(const char* desc);

void RenderSidebar(ViewState& view, deskbridge::core::UiState& ui_state, bridge::ExecutionMode mode);

// Context picker plus the resolved context/cluster/user summary.
void RenderKubePanel(kube::KubeStore& store, kube::RefreshDebouncer& refresh);

// Returns the button the user pressed this frame, if any.
DockAction RenderDockPanel(const dock::DockState& dock, ViewState& view);

void RenderSettingsPanel(deskbridge::core::UiState& ui_state, ViewState& view);
void RenderLogPanel(ViewState& view);
void RenderNotice(const Notice& notice, double now);

} // namespace ui
} // namespace shell
} // namespace deskbridge
