#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace proposal::exec {

using WorkItem = std::function<void()>;

/*
  Thread-safe blocking queue feeding the worker pool.
*/
class WorkQueue {
 public:
  // Throws util::InvalidState once the queue is shut down.
  void Enqueue(WorkItem item);

  // blocking wait; nullopt after shutdown once drained
  std::optional<WorkItem> Dequeue();

  void Shutdown();

  bool IsShutdown() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<WorkItem>    queue_;
  bool                    shutdown_ = false;
};

} // namespace proposal::exec
