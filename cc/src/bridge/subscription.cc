#include "deskbridge/bridge/subscription.h"

#include <utility>

namespace deskbridge {
namespace bridge {

Subscription::Subscription(CancelFn cancel) : cancel_(std::move(cancel)) {}

Subscription::~Subscription() { Cancel(); }

Subscription::Subscription(Subscription&& other) noexcept
    : cancel_(std::move(other.cancel_)) {
  other.cancel_ = nullptr;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    Cancel();
    cancel_ = std::move(other.cancel_);
    other.cancel_ = nullptr;
  }
  return *this;
}

void Subscription::Cancel() {
  if (!cancel_) return;
  // Clear first so a re-entrant Cancel() from inside the callback is a no-op.
  CancelFn cancel = std::move(cancel_);
  cancel_ = nullptr;
  cancel();
}

}  // namespace bridge
}  // namespace deskbridge
