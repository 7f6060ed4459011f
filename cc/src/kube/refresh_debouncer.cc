#include "deskbridge/kube/refresh_debouncer.h"

#include <utility>

namespace deskbridge {
namespace kube {

RefreshDebouncer::RefreshDebouncer(std::chrono::milliseconds window,
                                   std::function<void()> action, Clock clock)
    : window_(window), action_(std::move(action)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return std::chrono::steady_clock::now(); };
  }
}

void RefreshDebouncer::Trigger() {
  pending_ = true;
  last_trigger_ = clock_();
}

bool RefreshDebouncer::Poll() {
  if (!pending_) return false;
  if (clock_() - last_trigger_ < window_) return false;

  pending_ = false;
  if (action_) action_();
  return true;
}

}  // namespace kube
}  // namespace deskbridge
