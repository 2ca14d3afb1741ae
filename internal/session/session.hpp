#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/registry/task_id.hpp"

namespace proposal::session {

struct ConversationMessage {
  std::string role;
  std::string content;
};

/*
  Settings remembered across turns of one session.

  `rates` are stored already normalized to hourly values. Budget and
  timeline are kept apart from rates and are never folded into the
  configured defaults.
*/
struct ScopedSettings {
  std::map<std::string, double> rates;
  std::optional<std::string>    budget;
  std::optional<std::string>    timeline;
};

/*
  Conversation + document store for one proposal.

  Implementations must be safe to call from the orchestrating thread
  while a pipeline run is in flight; the pipeline only touches the
  session from the orchestrating thread.
*/
class Session {
 public:
  virtual ~Session() = default;

  virtual std::vector<ConversationMessage> ConversationHistory() const = 0;
  virtual void AppendMessage(ConversationMessage message)               = 0;

  virtual bool IsDocumentGenerated() const = 0;
  virtual void SetDocumentGenerated(bool generated) = 0;

  virtual std::string DocumentTitle() const              = 0;
  virtual void        SetDocumentTitle(std::string title) = 0;

  virtual std::string InitialIdea() const = 0;

  virtual std::string CurrentStage() const               = 0;
  virtual void        SetCurrentStage(std::string stage) = 0;

  // Persists the session. Returns false when the store rejected the write.
  virtual bool Save() = 0;

  virtual std::optional<std::string> PriorTaskOutput(registry::TaskId id) const = 0;
  virtual void SaveTaskOutput(registry::TaskId id, std::string content, std::string reason) = 0;

  virtual ScopedSettings ScopedState() const                 = 0;
  virtual void           SetScopedState(ScopedSettings state) = 0;
};

} // namespace proposal::session
