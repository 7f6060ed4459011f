#include "deskbridge/dock/dock_synchronizer.h"

#include <algorithm>

#include "deskbridge/core/logger.h"

namespace deskbridge {
namespace dock {

DockSynchronizer::DockSynchronizer(bridge::EventChannel& channel,
                                   DockState& state)
    : channel_(channel), state_(state) {}

void DockSynchronizer::Start() {
  if (IsRunning()) return;
  progress_sub_ = channel_.Subscribe(
      kProgressEvent, [this](const nlohmann::json& payload) {
        ApplyProgressEvent(payload, &state_);
      });
  badge_sub_ = channel_.Subscribe(
      kBadgeEvent, [this](const nlohmann::json& payload) {
        ApplyBadgeEvent(payload, &state_);
      });
}

void DockSynchronizer::Stop() {
  progress_sub_.Cancel();
  badge_sub_.Cancel();
}

bool DockSynchronizer::ApplyProgressEvent(const nlohmann::json& payload,
                                          DockState* state) {
  if (!payload.is_object()) return false;
  auto it = payload.find("progress");
  if (it == payload.end()) return false;

  if (it->is_null()) {
    state->progress.reset();
    return true;
  }
  if (!it->is_number()) {
    DESKBRIDGE_LOG_WARN(
        "Ignoring non-numeric dock progress: " +
        it->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    return false;
  }
  state->progress = std::clamp(it->get<double>(), 0.0, 1.0);
  return true;
}

bool DockSynchronizer::ApplyBadgeEvent(const nlohmann::json& payload,
                                       DockState* state) {
  if (!payload.is_object()) return false;
  auto it = payload.find("badge");
  if (it == payload.end()) return false;

  if (it->is_null()) {
    state->badge.reset();
    return true;
  }
  if (!it->is_string()) {
    DESKBRIDGE_LOG_WARN(
        "Ignoring non-string dock badge: " +
        it->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    return false;
  }
  state->badge = it->get<std::string>();
  return true;
}

}  // namespace dock
}  // namespace deskbridge
