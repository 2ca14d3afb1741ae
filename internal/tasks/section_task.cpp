#include "section_task.hpp"

#include <iomanip>
#include <map>
#include <sstream>
#include <string>

#include "internal/llm/language_model.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace proposal::tasks {

using state::StateKey;

namespace {

std::string ValueOrPlaceholder(const state::ProjectState& snapshot, StateKey key) {
  if (state::HasText(snapshot, key)) return state::Text(snapshot, key);
  return std::string(kNotProvided);
}

} // namespace

void RequireInitialIdea(const state::ProjectState& snapshot, registry::TaskId id) {
  if (!state::HasText(snapshot, StateKey::kInitialIdea)) {
    throw util::InvalidState(std::string(registry::TaskName(id)) + " needs an initial idea");
  }
}

std::string FormatRates(const state::ProjectState& snapshot) {
  if (snapshot.rates().empty()) return std::string(kNotProvided);

  // protobuf maps are unordered
  const std::map<std::string, double> ordered(snapshot.rates().begin(), snapshot.rates().end());

  std::ostringstream out;
  bool first = true;
  for (const auto& [role, hourly] : ordered) {
    if (!first) out << '\n';
    first = false;
    out << role << ": " << std::fixed << std::setprecision(2) << hourly << "/hour";
  }
  return out.str();
}

SectionTask::SectionTask(registry::TaskId id,
                         std::vector<SectionSpec> sections,
                         std::shared_ptr<llm::GenerationBackend> backend)
    : id_(id),
      sections_(std::move(sections)),
      backend_(std::move(backend)) {
  if (!backend_) throw util::InvalidState("section task requires a generation backend");
}

state::StateUpdate SectionTask::Run(const state::ProjectState& snapshot, TaskContext& context) const {
  RequireInitialIdea(snapshot, id_);

  state::StateUpdate update;
  for (const auto& spec : sections_) {
    llm::GenerationRequest request;
    request.task    = std::string(registry::TaskName(id_));
    request.section = std::string(spec.section);

    request.inputs["initial_idea"] = state::Text(snapshot, StateKey::kInitialIdea);
    for (auto key : spec.inputs) {
      request.inputs[std::string(state::StateKeyName(key))] = ValueOrPlaceholder(snapshot, key);
    }
    if (state::HasText(snapshot, StateKey::kUserInput)) {
      request.inputs["user_input"] = snapshot.user_input();
    }
    if (spec.with_settings) {
      request.inputs["rates"]    = FormatRates(snapshot);
      request.inputs["currency"] = ValueOrPlaceholder(snapshot, StateKey::kCurrency);
      request.inputs["budget"]   = ValueOrPlaceholder(snapshot, StateKey::kBudget);
      request.inputs["timeline"] = ValueOrPlaceholder(snapshot, StateKey::kTimeline);
    }

    request.previous_content = state::Text(snapshot, spec.output);
    request.instructions     = snapshot.instructions();

    PROPOSAL_LOG_DEBUG("generating section",
                       {observability::StringField("pipeline", context.pipeline),
                        observability::StringField("task", request.task),
                        observability::StringField("section", request.section),
                        observability::BoolField("rewrite", !request.previous_content.empty())});

    update.SetText(spec.output, backend_->Generate(request));
  }
  return update;
}

} // namespace proposal::tasks
