#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "work_queue.hpp"

namespace proposal::exec {

/*
  Fixed set of background threads draining a WorkQueue.

  Shared by every pipeline run in the process; level dispatch submits
  one item per task. Items queued before Stop() are still executed.
*/
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  // Throws util::InvalidState when the pool is not running.
  void Submit(WorkItem item);

  std::size_t thread_count() const {
    return thread_count_;
  }

 private:
  void Run();

  std::size_t                thread_count_;
  std::shared_ptr<WorkQueue> queue_;
  std::vector<std::thread>   threads_;
  std::atomic<bool>          running_{false};
};

} // namespace proposal::exec
