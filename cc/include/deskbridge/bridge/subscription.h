#ifndef DESKBRIDGE_BRIDGE_SUBSCRIPTION_H_
#define DESKBRIDGE_BRIDGE_SUBSCRIPTION_H_

#include <functional>

namespace deskbridge {
namespace bridge {

// Cancellation handle for one event registration.
//
// Cancel() may be called any number of times; only the first call reaches the
// transport. A handle whose transport is already gone cancels as a no-op.
// Destroying an active handle cancels it. A default-constructed handle is
// inactive and safe to cancel.
class Subscription {
 public:
  using CancelFn = std::function<void()>;

  Subscription() = default;
  explicit Subscription(CancelFn cancel);
  ~Subscription();

  Subscription(Subscription&& other) noexcept;
  Subscription& operator=(Subscription&& other) noexcept;

  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  void Cancel();
  bool IsActive() const { return static_cast<bool>(cancel_); }

 private:
  CancelFn cancel_;
};

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_SUBSCRIPTION_H_
