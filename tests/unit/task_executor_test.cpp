#include "internal/exec/task_executor.hpp"
#include "internal/exec/worker_pool.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/tasks/task.hpp"
#include "internal/tasks/task_catalog.hpp"
#include "internal/util/errors.hpp"
#include "support/fake_backends.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

using proposal::exec::TaskExecutor;
using proposal::exec::WorkerPool;
using proposal::registry::TaskId;
using proposal::state::ProjectState;
using proposal::state::StateKey;
using proposal::state::StateUpdate;
using proposal::testing::FakeGenerationBackend;

struct Fixture {
  std::shared_ptr<FakeGenerationBackend> backend = std::make_shared<FakeGenerationBackend>();
  std::shared_ptr<WorkerPool>            pool    = std::make_shared<WorkerPool>(4);

  TaskExecutor Executor() {
    pool->Start();
    return TaskExecutor(pool, proposal::tasks::BuildTaskRegistry(backend));
  }
};

ProjectState Seed() {
  ProjectState state;
  state.set_initial_idea("a recipe app");
  return state;
}

// Writes a key it does not own.
class RogueTask final : public proposal::tasks::Task {
 public:
  TaskId id() const override {
    return TaskId::kTitle;
  }

  StateUpdate Run(const ProjectState&, proposal::tasks::TaskContext&) const override {
    StateUpdate update;
    update.SetText(StateKey::kRefinedScope, "hijacked");
    return update;
  }
};

void TestLevelReadsOneSnapshot() {
  Fixture f;
  f.backend->Delay("business_analysis", std::chrono::milliseconds(50));
  auto executor = f.Executor();

  auto state = Seed();
  executor.RunLevel({TaskId::kScopeRefinement, TaskId::kBusinessAnalyst}, state, "test", 0);

  // scope finished first but business_analyst still saw the level-start state
  auto requests = f.backend->RequestsFor("business_analysis");
  assert(requests.size() == 1);
  assert(requests[0].inputs.at("refined_scope") == "Not provided");
  assert(state.refined_scope() == "refined_scope for a recipe app");
  assert(state.business_analysis() == "business_analysis for a recipe app");
}

void TestMergeFollowsCompletionOrder() {
  Fixture f;
  f.backend->Delay("title", std::chrono::milliseconds(80));
  auto executor = f.Executor();

  auto state = Seed();
  std::vector<TaskId> order;
  auto results = executor.RunLevel({TaskId::kTitle, TaskId::kScopeRefinement},
                                   state,
                                   "test",
                                   0,
                                   [&](TaskId id, const ProjectState& merged) {
                                     order.push_back(id);
                                     if (id == TaskId::kTitle) assert(!merged.refined_scope().empty());
                                   });

  assert(results.size() == 2);
  assert((order == std::vector<TaskId>{TaskId::kScopeRefinement, TaskId::kTitle}));
  assert(state.sections_generated_size() == 2);
  assert(state.sections_generated(0) == "scope_refinement");
  assert(state.sections_generated(1) == "title");
}

void TestFailureDoesNotCancelSiblings() {
  Fixture f;
  f.backend->Fail("business_analysis");
  f.backend->Delay("technical_spec", std::chrono::milliseconds(30));
  auto executor = f.Executor();

  auto state = Seed();
  bool threw = false;
  try {
    executor.RunLevel({TaskId::kBusinessAnalyst, TaskId::kTechnicalArchitect}, state, "test", 1);
  } catch (const proposal::util::TaskExecutionError& e) {
    threw = true;
    assert(e.task_name() == "business_analyst");
  }
  assert(threw);

  assert(state.business_analysis().empty());
  assert(state.technical_spec() == "technical_spec for a recipe app");
  assert(state.sections_generated_size() == 1);
}

void TestUndeclaredKeyIsRejected() {
  auto pool = std::make_shared<WorkerPool>(1);
  pool->Start();
  auto registry = std::make_shared<proposal::registry::TaskRegistry>();
  registry->Register(std::make_unique<RogueTask>());
  TaskExecutor executor(pool, registry);

  auto state = Seed();
  bool threw = false;
  try {
    executor.RunLevel({TaskId::kTitle}, state, "test", 0);
  } catch (const proposal::util::TaskExecutionError& e) {
    threw = true;
    assert(e.task_name() == "title");
  }
  assert(threw);
  assert(state.refined_scope().empty());
  assert(state.sections_generated_size() == 0);
}

void TestUnregisteredTaskFailsLevel() {
  auto pool = std::make_shared<WorkerPool>(1);
  pool->Start();
  TaskExecutor executor(pool, std::make_shared<proposal::registry::TaskRegistry>());

  auto state = Seed();
  bool threw = false;
  try {
    executor.RunLevel({TaskId::kProjectManager}, state, "test", 0);
  } catch (const proposal::util::TaskExecutionError& e) {
    threw = true;
    assert(e.task_name() == "project_manager");
  }
  assert(threw);
}

void TestHookFailureIsNotFatal() {
  Fixture f;
  auto executor = f.Executor();

  auto state   = Seed();
  auto results = executor.RunLevel({TaskId::kTitle}, state, "test", 0, [](TaskId, const ProjectState&) {
    throw std::runtime_error("session offline");
  });
  assert(results.count(TaskId::kTitle) == 1);
  assert(state.proposal_title() == "title for a recipe app");
}

void TestEmptyLevel() {
  Fixture f;
  auto executor = f.Executor();

  auto state = Seed();
  assert(executor.RunLevel({}, state, "test", 0).empty());
  assert(f.backend->Requests().empty());
}

} // namespace

int main() {
  TestLevelReadsOneSnapshot();
  TestMergeFollowsCompletionOrder();
  TestFailureDoesNotCancelSiblings();
  TestUndeclaredKeyIsRejected();
  TestUnregisteredTaskFailsLevel();
  TestHookFailureIsNotFatal();
  TestEmptyLevel();

  std::cout << "proposal_unit_task_executor: pass\n";
  return 0;
}
