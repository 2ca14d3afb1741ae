#include "routing_classifier.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/routing/decision_parser.hpp"
#include "internal/routing/keyword_table.hpp"
#include "internal/session/session.hpp"
#include "internal/util/errors.hpp"

namespace proposal::routing {

namespace {

std::vector<std::string> SplitWords(std::string_view lowered) {
  std::vector<std::string> words;
  std::string current;
  for (char c : lowered) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '\'') {
      current.push_back(c);
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) words.push_back(std::move(current));
  return words;
}

void LogDecision(const RoutingDecision& decision) {
  PROPOSAL_LOG_INFO("routing decision",
                    {observability::StringField("action", ActionName(decision.action)),
                     observability::StringField("source", DecisionSourceName(decision.source)),
                     observability::IntField("tasks", static_cast<std::int64_t>(decision.task_ids.Size())),
                     observability::DoubleField("confidence", decision.confidence)});
}

} // namespace

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
  return out;
}

RoutingClassifier::RoutingClassifier(const proposal::runtime::config::RuntimeConfig& config,
                                     std::shared_ptr<llm::ClassificationBackend> backend)
    : history_turns_(config.routing().history_turns()),
      fallback_confidence_(config.routing().fallback_confidence()),
      backend_(std::move(backend)) {
  for (const auto& trigger : config.routing().generate_triggers()) {
    triggers_.push_back(ToLower(trigger));
  }
  for (const auto& command : config.routing().generate_commands()) {
    commands_.push_back(ToLower(command));
  }
  for (const auto& greeting : config.routing().greetings()) {
    greetings_.push_back(ToLower(greeting));
  }
  for (const auto& [role, hourly] : config.settings().default_rates()) {
    roles_.push_back(role);
  }
  std::sort(roles_.begin(), roles_.end());
}

bool RoutingClassifier::RequestsGeneration(std::string_view lowered) const {
  for (const auto& trigger : triggers_) {
    if (!trigger.empty() && lowered.find(trigger) != std::string_view::npos) return true;
  }

  // "generate a new timeline" is an edit; only a trailing command counts
  const auto words = SplitWords(lowered);
  if (words.empty()) return false;
  return std::find(commands_.begin(), commands_.end(), words.back()) != commands_.end();
}

bool RoutingClassifier::IsGreeting(std::string_view lowered) const {
  const auto words = SplitWords(lowered);
  if (words.empty()) return false;
  return std::all_of(words.begin(), words.end(), [&](const std::string& word) {
    return std::find(greetings_.begin(), greetings_.end(), word) != greetings_.end();
  });
}

RoutingDecision RoutingClassifier::KeywordFallback(std::string_view lowered) const {
  RoutingDecision decision;
  decision.source     = DecisionSource::kKeywordFallback;
  decision.task_ids   = MatchKeywords(lowered);
  decision.confidence = fallback_confidence_;
  if (decision.task_ids.Empty()) {
    decision.action    = Action::kConversation;
    decision.reasoning = "No section keywords matched";
  } else {
    decision.action    = Action::kEdit;
    decision.reasoning = "Matched section keywords";
  }
  return decision;
}

llm::ClassificationRequest RoutingClassifier::BuildRequest(std::string_view utterance,
                                                           const session::Session& session) const {
  llm::ClassificationRequest request;
  request.utterance       = std::string(utterance);
  request.document_exists = session.IsDocumentGenerated();
  request.current_stage   = session.CurrentStage();
  request.roles           = roles_;

  const auto history = session.ConversationHistory();
  const auto first   = history.size() > history_turns_ ? history.size() - history_turns_ : 0;
  for (std::size_t i = first; i < history.size(); ++i) {
    request.history.push_back(history[i].role + ": " + history[i].content);
  }

  for (const auto& d : registry::kTaskDescriptors) {
    if (d.sink) continue;
    llm::CatalogueEntry entry;
    entry.task        = std::string(d.name);
    entry.description = std::string(d.description);
    for (auto key : d.outputs.Keys()) {
      entry.sections.emplace_back(state::StateKeyName(key));
    }
    request.catalogue.push_back(std::move(entry));
  }
  return request;
}

RoutingDecision RoutingClassifier::Classify(std::string_view utterance, const session::Session& session) const {
  const auto lowered = ToLower(utterance);

  if (RequestsGeneration(lowered)) {
    RoutingDecision decision;
    decision.action                = Action::kGenerate;
    decision.needs_full_generation = true;
    decision.confidence            = 1.0;
    decision.reasoning             = "User explicitly requested proposal generation";
    decision.source                = DecisionSource::kFastPath;
    LogDecision(decision);
    return decision;
  }

  if (IsGreeting(lowered)) {
    RoutingDecision decision;
    decision.action     = Action::kConversation;
    decision.confidence = 1.0;
    decision.reasoning  = "Greeting detected";
    decision.source     = DecisionSource::kGreeting;
    LogDecision(decision);
    return decision;
  }

  RoutingDecision decision;
  if (!backend_) {
    decision = KeywordFallback(lowered);
  } else {
    try {
      decision = ParseDecision(backend_->Classify(BuildRequest(utterance, session)));
    } catch (const util::RoutingParseError& e) {
      PROPOSAL_LOG_WARN("classifier output rejected, using keywords", {observability::StringField("error", e.what())});
      decision = KeywordFallback(lowered);
    } catch (const std::exception& e) {
      PROPOSAL_LOG_WARN("classifier call failed, using keywords", {observability::StringField("error", e.what())});
      decision = KeywordFallback(lowered);
    }
  }

  Sanitize(decision);
  LogDecision(decision);
  return decision;
}

} // namespace proposal::routing
