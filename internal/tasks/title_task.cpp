#include "title_task.hpp"

#include <cctype>

#include "internal/llm/language_model.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tasks/section_task.hpp"
#include "internal/util/errors.hpp"

namespace proposal::tasks {

using state::StateKey;

namespace {

constexpr std::size_t kFallbackIdeaChars = 50;

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

bool IsTrimmed(char c) {
  return std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '\'';
}

} // namespace

std::string CleanTitle(std::string_view raw) {
  std::size_t begin = 0;
  std::size_t end   = raw.size();
  while (begin < end && IsTrimmed(raw[begin])) ++begin;
  while (end > begin && IsTrimmed(raw[end - 1])) --end;
  return std::string(raw.substr(begin, end - begin));
}

std::string FallbackTitle(std::string_view idea) {
  auto trimmed = CleanTitle(idea);
  if (trimmed.size() > kFallbackIdeaChars) {
    // cut on a code point boundary
    std::size_t cut = kFallbackIdeaChars;
    while (cut > 0 && IsContinuationByte(trimmed[cut])) --cut;
    trimmed.resize(cut);
  }
  return trimmed + " Proposal";
}

TitleTask::TitleTask(std::shared_ptr<llm::GenerationBackend> backend) : backend_(std::move(backend)) {
  if (!backend_) throw util::InvalidState("title task requires a generation backend");
}

state::StateUpdate TitleTask::Run(const state::ProjectState& snapshot, TaskContext& context) const {
  RequireInitialIdea(snapshot, id());

  llm::GenerationRequest request;
  request.task                   = std::string(registry::TaskName(id()));
  request.section                = "title";
  request.inputs["initial_idea"] = snapshot.initial_idea();

  const bool retitle = state::HasText(snapshot, StateKey::kProposalTitle) && state::HasText(snapshot, StateKey::kUserInput);
  if (retitle) {
    request.previous_content = snapshot.proposal_title();
    request.inputs["user_input"] = snapshot.user_input();
  }
  request.instructions = snapshot.instructions();

  std::string title;
  try {
    title = CleanTitle(backend_->Generate(request));
  } catch (const std::exception& e) {
    PROPOSAL_LOG_WARN("title generation failed, using fallback",
                      {observability::StringField("pipeline", context.pipeline),
                       observability::StringField("error", e.what())});
  }
  if (title.empty()) title = FallbackTitle(snapshot.initial_idea());

  state::StateUpdate update;
  update.SetText(StateKey::kProposalTitle, std::move(title));
  return update;
}

} // namespace proposal::tasks
