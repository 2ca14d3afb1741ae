#include "pipeline_executor.hpp"

#include "internal/observability/logging.hpp"
#include "internal/tasks/compile_task.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace proposal::pipeline {

using registry::TaskId;

namespace {

PipelineRun NewRun(const Pipeline& pipeline) {
  PipelineRun run;
  run.pipeline = pipeline.name();
  run.levels   = pipeline.levels();
  for (std::size_t i = 0; i < run.levels.size(); ++i) {
    for (auto id : run.levels[i]) {
      run.tasks.push_back({id, i, TaskStatus::kPending});
    }
  }
  return run;
}

void SetStatus(PipelineRun& run, TaskId id, TaskStatus status) {
  for (auto& task : run.tasks) {
    if (task.id == id) task.status = status;
  }
}

void FailUnfinished(PipelineRun& run, std::size_t level) {
  for (auto& task : run.tasks) {
    if (task.level == level && task.status == TaskStatus::kRunning) task.status = TaskStatus::kFailed;
  }
}

} // namespace

std::string_view TaskStatusName(TaskStatus status) {
  switch (status) {
    case TaskStatus::kPending:
      return "pending";
    case TaskStatus::kRunning:
      return "running";
    case TaskStatus::kDone:
      return "done";
    case TaskStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

TaskStatus PipelineRun::StatusOf(TaskId id) const {
  for (const auto& task : tasks) {
    if (task.id == id) return task.status;
  }
  throw util::UnknownTask(std::string(registry::TaskName(id)) + " is not part of run " + pipeline);
}

PipelineExecutor::PipelineExecutor(std::shared_ptr<exec::TaskExecutor> executor) : executor_(std::move(executor)) {
  if (!executor_) throw util::InvalidState("pipeline executor requires a task executor");
}

void PipelineExecutor::SetProgressObserver(ProgressObserver observer) {
  observer_ = std::move(observer);
}

void PipelineExecutor::Notify(std::string_view stage, const std::string& message) const {
  if (observer_) {
    try {
      observer_(stage, message);
    } catch (const std::exception& e) {
      PROPOSAL_LOG_WARN("progress observer failed",
                        {observability::StringField("stage", stage), observability::StringField("error", e.what())});
    }
    return;
  }
  PROPOSAL_LOG_INFO(message, {observability::StringField("stage", stage)});
}

RunOutcome PipelineExecutor::Execute(const Pipeline& pipeline, state::ProjectState state) const {
  RunOutcome outcome{std::move(state), NewRun(pipeline), util::Result::Ok()};
  auto& run = outcome.run;

  const auto started = util::Now();
  Notify("start", "Starting " + pipeline.display_name() + "...");

  auto fail = [&](util::Result status) {
    run.terminal   = "failed";
    run.reason     = status.message;
    outcome.status = std::move(status);
    Notify("error", "Pipeline execution failed: " + run.reason);
    PROPOSAL_LOG_ERROR("pipeline failed",
                       {observability::StringField("pipeline", pipeline.name()),
                        observability::StringField("code", util::ErrorCodeName(outcome.status.code)),
                        observability::IntField("elapsed_ms", util::ElapsedMillis(started))});
  };

  try {
    pipeline.ValidatePrerequisites(outcome.state);
  } catch (const util::PrerequisiteFailed& e) {
    fail(util::ToResult(e));
    return outcome;
  }

  const auto pipeline_hook = pipeline.MakeCompletionHook();
  auto hook = [&run, &pipeline_hook](TaskId id, const state::ProjectState& merged) {
    SetStatus(run, id, TaskStatus::kDone);
    if (pipeline_hook) pipeline_hook(id, merged);
  };

  for (std::size_t i = 0; i < run.levels.size(); ++i) {
    const auto& level = run.levels[i];
    for (auto id : level) SetStatus(run, id, TaskStatus::kRunning);

    Notify("level_start", "Level " + std::to_string(i + 1) + "/" + std::to_string(run.levels.size()) + ": " +
                              planner::DescribePlan({level}));

    try {
      executor_->RunLevel(level, outcome.state, pipeline.name(), i, hook);
    } catch (const util::TaskExecutionError& e) {
      if (auto failed = registry::ParseTaskId(e.task_name())) SetStatus(run, *failed, TaskStatus::kFailed);
      FailUnfinished(run, i);
      fail(util::ToResult(e));
      return outcome;
    } catch (const std::exception& e) {
      FailUnfinished(run, i);
      fail(util::ToResult(e));
      return outcome;
    }

    Notify("level_complete", "Level " + std::to_string(i + 1) + " complete");
  }

  if (pipeline.tasks().Intersects(registry::SinkTasks()) &&
      outcome.state.current_stage() == tasks::kStageFailed) {
    fail(util::Result::Err(util::ErrorCode::Incomplete, outcome.state.error()));
    return outcome;
  }

  run.terminal = "completed";
  Notify("complete", pipeline.display_name() + " completed successfully");
  PROPOSAL_LOG_INFO("pipeline completed",
                    {observability::StringField("pipeline", pipeline.name()),
                     observability::IntField("levels", static_cast<std::int64_t>(run.levels.size())),
                     observability::IntField("elapsed_ms", util::ElapsedMillis(started))});
  return outcome;
}

} // namespace proposal::pipeline
