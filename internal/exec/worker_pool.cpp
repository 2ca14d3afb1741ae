#include "worker_pool.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace proposal::exec {

WorkerPool::WorkerPool(std::size_t threads)
    : thread_count_(threads == 0 ? 1 : threads),
      queue_(std::make_shared<WorkQueue>()) {}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(thread_count_);
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }

  PROPOSAL_LOG_INFO("worker pool started", {observability::IntField("threads", static_cast<std::int64_t>(thread_count_))});
}

void WorkerPool::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Submit(WorkItem item) {
  if (!running_) throw util::InvalidState("worker pool is not running");
  queue_->Enqueue(std::move(item));
}

void WorkerPool::Run() {
  while (true) {
    auto item = queue_->Dequeue();
    if (!item) break;

    try {
      (*item)();
    } catch (const std::exception& e) {
      PROPOSAL_LOG_ERROR("work item failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace proposal::exec
