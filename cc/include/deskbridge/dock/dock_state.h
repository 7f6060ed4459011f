#ifndef DESKBRIDGE_DOCK_DOCK_STATE_H_
#define DESKBRIDGE_DOCK_DOCK_STATE_H_

#include <optional>
#include <string>

namespace deskbridge {
namespace dock {

// Dock tile state as last reported by the host. Both fields start unset.
struct DockState {
  std::optional<double> progress;  // fraction in [0, 1]
  std::optional<std::string> badge;

  // Display values, derived on every call.
  int ProgressPercent() const;       // 0 when cleared
  std::string BadgeText() const;     // empty when cleared
};

bool operator==(const DockState& a, const DockState& b);
inline bool operator!=(const DockState& a, const DockState& b) {
  return !(a == b);
}

}  // namespace dock
}  // namespace deskbridge

#endif  // DESKBRIDGE_DOCK_DOCK_STATE_H_
