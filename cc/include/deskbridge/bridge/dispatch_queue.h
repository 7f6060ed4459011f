#ifndef DESKBRIDGE_BRIDGE_DISPATCH_QUEUE_H_
#define DESKBRIDGE_BRIDGE_DISPATCH_QUEUE_H_

#include <cstddef>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>

namespace deskbridge {
namespace bridge {

// Hands work from host worker threads to the UI thread. Post() is safe from
// any thread; Pump() runs queued tasks in post order on the caller's thread.
class DispatchQueue {
 public:
  using Task = std::function<void()>;

  void Post(Task task);

  // Runs at most `max_tasks` tasks that were queued before the call. Tasks
  // posted while pumping wait for the next Pump(). Returns the count run.
  // An exception from a task propagates; tasks behind it stay queued.
  size_t Pump(size_t max_tasks = std::numeric_limits<size_t>::max());

  size_t Pending() const;

 private:
  mutable std::mutex mutex_;
  std::deque<Task> tasks_;
};

}  // namespace bridge
}  // namespace deskbridge

#endif  // DESKBRIDGE_BRIDGE_DISPATCH_QUEUE_H_
