#ifndef DESKBRIDGE_KUBE_REFRESH_DEBOUNCER_H_
#define DESKBRIDGE_KUBE_REFRESH_DEBOUNCER_H_

#include <chrono>
#include <functional>

namespace deskbridge {
namespace kube {

// Trailing-edge debounce for refresh triggers. A burst of Trigger() calls
// produces one action, run by the first Poll() at least `window` after the
// last trigger. Poll() is expected once per frame.
class RefreshDebouncer {
 public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  RefreshDebouncer(std::chrono::milliseconds window,
                   std::function<void()> action, Clock clock = {});

  void Trigger();
  bool Poll();
  void Cancel() { pending_ = false; }

  bool IsPending() const { return pending_; }
  std::chrono::milliseconds GetWindow() const { return window_; }
  void SetWindow(std::chrono::milliseconds window) { window_ = window; }

 private:
  std::chrono::milliseconds window_;
  std::function<void()> action_;
  Clock clock_;
  bool pending_ = false;
  std::chrono::steady_clock::time_point last_trigger_{};
};

}  // namespace kube
}  // namespace deskbridge

#endif  // DESKBRIDGE_KUBE_REFRESH_DEBOUNCER_H_
