#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/pipeline/pipeline.hpp"
#include "internal/util/result.hpp"

namespace proposal::pipeline {

enum class TaskStatus {
  kPending,
  kRunning,
  kDone,
  kFailed,
};

std::string_view TaskStatusName(TaskStatus status);

struct TaskRun {
  registry::TaskId id;
  std::size_t      level  = 0;
  TaskStatus       status = TaskStatus::kPending;
};

/*
  Bookkeeping of one Execute() call. `terminal` is "completed" or
  "failed" once the run is over; `reason` explains a failure.
*/
struct PipelineRun {
  std::string          pipeline;
  planner::LevelPlan   levels;
  std::vector<TaskRun> tasks;
  std::string          terminal;
  std::string          reason;

  // Throws util::UnknownTask for ids outside the run.
  TaskStatus StatusOf(registry::TaskId id) const;
};

struct RunOutcome {
  state::ProjectState state;
  PipelineRun         run;
  util::Result        status;
};

using ProgressObserver = std::function<void(std::string_view stage, std::string_view message)>;

/*
  Drives a pipeline level by level on the task executor.

  Never throws for run failures: they are reported in RunOutcome::status.
  Progress stages are "start", "level_start", "level_complete",
  "complete" and "error".
*/
class PipelineExecutor {
 public:
  explicit PipelineExecutor(std::shared_ptr<exec::TaskExecutor> executor);

  // Exceptions thrown by the observer are logged and dropped.
  void SetProgressObserver(ProgressObserver observer);

  RunOutcome Execute(const Pipeline& pipeline, state::ProjectState state) const;

 private:
  void Notify(std::string_view stage, const std::string& message) const;

  std::shared_ptr<exec::TaskExecutor> executor_;
  ProgressObserver                    observer_;
};

} // namespace proposal::pipeline
