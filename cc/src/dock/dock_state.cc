#include "deskbridge/dock/dock_state.h"

#include <cmath>

namespace deskbridge {
namespace dock {

int DockState::ProgressPercent() const {
  if (!progress) return 0;
  return static_cast<int>(std::lround(*progress * 100.0));
}

std::string DockState::BadgeText() const { return badge.value_or(""); }

bool operator==(const DockState& a, const DockState& b) {
  return a.progress == b.progress && a.badge == b.badge;
}

}  // namespace dock
}  // namespace deskbridge
