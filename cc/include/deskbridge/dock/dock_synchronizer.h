#ifndef DESKBRIDGE_DOCK_DOCK_SYNCHRONIZER_H_
#define DESKBRIDGE_DOCK_DOCK_SYNCHRONIZER_H_

#include <nlohmann/json.hpp>

#include "deskbridge/bridge/event_channel.h"
#include "deskbridge/bridge/subscription.h"
#include "deskbridge/dock/dock_state.h"

namespace deskbridge {
namespace dock {

// Folds the host's dock events into one DockState.
//
//   progress-updated  {"progress": number|null}
//   badge-updated     {"badge": string|null}
//
// Each event touches only its own field. null clears the field; a payload
// without the field leaves it alone.
class DockSynchronizer {
 public:
  static constexpr const char* kProgressEvent = "progress-updated";
  static constexpr const char* kBadgeEvent = "badge-updated";

  DockSynchronizer(bridge::EventChannel& channel, DockState& state);
  ~DockSynchronizer() = default;

  DockSynchronizer(const DockSynchronizer&) = delete;
  DockSynchronizer& operator=(const DockSynchronizer&) = delete;

  void Start();
  void Stop();
  bool IsRunning() const {
    return progress_sub_.IsActive() || badge_sub_.IsActive();
  }

  const DockState& GetState() const { return state_; }

  // Return true when the payload changed or cleared the field.
  static bool ApplyProgressEvent(const nlohmann::json& payload,
                                 DockState* state);
  static bool ApplyBadgeEvent(const nlohmann::json& payload, DockState* state);

 private:
  bridge::EventChannel& channel_;
  DockState& state_;
  bridge::Subscription progress_sub_;
  bridge::Subscription badge_sub_;
};

}  // namespace dock
}  // namespace deskbridge

#endif  // DESKBRIDGE_DOCK_DOCK_SYNCHRONIZER_H_
