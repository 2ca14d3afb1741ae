#include "work_queue.hpp"

#include "internal/util/errors.hpp"

namespace proposal::exec {

void WorkQueue::Enqueue(WorkItem item) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw util::InvalidState("work queue is shut down");
    queue_.push(std::move(item));
  }
  cv_.notify_one();
}

std::optional<WorkItem> WorkQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  WorkItem item = std::move(queue_.front());
  queue_.pop();
  return item;
}

void WorkQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool WorkQueue::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace proposal::exec
