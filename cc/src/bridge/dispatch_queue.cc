#include "deskbridge/bridge/dispatch_queue.h"

#include <algorithm>
#include <utility>

namespace deskbridge {
namespace bridge {

void DispatchQueue::Post(Task task) {
  if (!task) return;
  std::lock_guard<std::mutex> lock(mutex_);
  tasks_.push_back(std::move(task));
}

size_t DispatchQueue::Pump(size_t max_tasks) {
  size_t budget;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    budget = std::min(max_tasks, tasks_.size());
  }

  // Pop one task at a time so a task that throws leaves the rest queued.
  size_t ran = 0;
  while (ran < budget) {
    Task task;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (tasks_.empty()) break;
      task = std::move(tasks_.front());
      tasks_.pop_front();
    }
    ++ran;
    task();
  }
  return ran;
}

size_t DispatchQueue::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

}  // namespace bridge
}  // namespace deskbridge
