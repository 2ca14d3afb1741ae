#include "task_executor.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>

#include "internal/exec/worker_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/tasks/task.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace proposal::exec {

using registry::TaskId;

namespace {

struct Completion {
  TaskId                            id;
  std::optional<state::StateUpdate> update;
  std::exception_ptr                error;
  int64_t                           elapsed_ms = 0;
};

/*
  Level-local completion channel. Workers push, the orchestrating
  thread pops.
*/
class CompletionQueue {
 public:
  void Push(Completion completion) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(completion));
    }
    cv_.notify_one();
  }

  Completion Pop() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return !queue_.empty(); });
    Completion completion = std::move(queue_.front());
    queue_.pop_front();
    return completion;
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<Completion>  queue_;
};

std::string DescribeError(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown error";
  }
}

// Rejects updates touching keys the task does not own.
void CheckOwnership(TaskId id, const state::StateUpdate& update) {
  const auto& owned = registry::Describe(id).outputs;
  for (auto key : update.keys.Keys()) {
    if (!owned.Contains(key)) {
      throw util::InvalidState("task " + std::string(registry::TaskName(id)) + " wrote undeclared key " +
                               std::string(state::StateKeyName(key)));
    }
  }
}

} // namespace

TaskExecutor::TaskExecutor(std::shared_ptr<WorkerPool> pool, std::shared_ptr<const registry::TaskRegistry> registry)
    : pool_(std::move(pool)),
      registry_(std::move(registry)) {
  if (!pool_ || !registry_) throw util::InvalidState("task executor requires a worker pool and a registry");
}

std::map<TaskId, state::StateUpdate> TaskExecutor::RunLevel(const planner::Level& level,
                                                            state::ProjectState& state,
                                                            const std::string& pipeline,
                                                            std::size_t level_index,
                                                            const CompletionHook& hook) {
  std::map<TaskId, state::StateUpdate> results;
  if (level.empty()) return results;

  auto snapshot    = std::make_shared<const state::ProjectState>(state);
  auto completions = std::make_shared<CompletionQueue>();

  std::size_t dispatched = 0;
  std::optional<std::pair<TaskId, std::string>> first_failure;

  for (auto id : level) {
    const tasks::Task* task = nullptr;
    try {
      task = &registry_->Get(id);
    } catch (const util::UnknownTask& e) {
      if (!first_failure) first_failure.emplace(id, e.what());
      continue;
    }

    tasks::TaskContext context{pipeline, level_index};
    auto item = [task, id, snapshot, completions, context]() mutable {
      Completion completion{id};
      const auto started = util::Now();
      try {
        completion.update = task->Run(*snapshot, context);
        CheckOwnership(id, *completion.update);
      } catch (...) {
        completion.update.reset();
        completion.error = std::current_exception();
      }
      completion.elapsed_ms = util::ElapsedMillis(started);
      completions->Push(std::move(completion));
    };

    // Already-dispatched siblings still settle below.
    try {
      pool_->Submit(std::move(item));
    } catch (const util::InvalidState& e) {
      if (!first_failure) first_failure.emplace(id, e.what());
      continue;
    }
    ++dispatched;
  }

  for (std::size_t settled = 0; settled < dispatched; ++settled) {
    Completion completion = completions->Pop();
    const auto name       = registry::TaskName(completion.id);

    if (completion.error) {
      const auto message = DescribeError(completion.error);
      PROPOSAL_LOG_ERROR("task failed",
                         {observability::StringField("pipeline", pipeline),
                          observability::StringField("task", name),
                          observability::StringField("error", message)});
      if (!first_failure) first_failure.emplace(completion.id, message);
      continue;
    }

    state::Merge(state, *completion.update);
    state::MarkSectionGenerated(state, name);

    PROPOSAL_LOG_DEBUG("task merged",
                       {observability::StringField("pipeline", pipeline),
                        observability::StringField("task", name),
                        observability::IntField("level", static_cast<std::int64_t>(level_index)),
                        observability::IntField("elapsed_ms", completion.elapsed_ms)});

    if (hook) {
      try {
        hook(completion.id, state);
      } catch (const std::exception& e) {
        PROPOSAL_LOG_WARN("completion hook failed",
                          {observability::StringField("task", name), observability::StringField("error", e.what())});
      }
    }

    results.emplace(completion.id, std::move(*completion.update));
  }

  if (first_failure) {
    throw util::TaskExecutionError(std::string(registry::TaskName(first_failure->first)), first_failure->second);
  }

  return results;
}

} // namespace proposal::exec
