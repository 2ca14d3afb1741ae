#pragma once

#include <array>
#include <cstdint>
#include <mutex>

#include "session.hpp"

namespace proposal::session {

struct TaskOutputRevision {
  std::string content;
  std::string reason;
};

/*
  In-process session store.

  Every task keeps its full revision history; PriorTaskOutput() returns
  the latest revision. Save() only counts writes.
*/
class MemorySession final : public Session {
 public:
  explicit MemorySession(std::string initial_idea);

  std::vector<ConversationMessage> ConversationHistory() const override;
  void AppendMessage(ConversationMessage message) override;

  bool IsDocumentGenerated() const override;
  void SetDocumentGenerated(bool generated) override;

  std::string DocumentTitle() const override;
  void        SetDocumentTitle(std::string title) override;

  std::string InitialIdea() const override;

  std::string CurrentStage() const override;
  void        SetCurrentStage(std::string stage) override;

  bool Save() override;

  std::optional<std::string> PriorTaskOutput(registry::TaskId id) const override;
  void SaveTaskOutput(registry::TaskId id, std::string content, std::string reason) override;

  ScopedSettings ScopedState() const override;
  void           SetScopedState(ScopedSettings state) override;

  std::vector<TaskOutputRevision> Revisions(registry::TaskId id) const;

  uint64_t save_count() const;

 private:
  mutable std::mutex mutex_;

  std::string                      initial_idea_;
  std::vector<ConversationMessage> history_;
  bool                             document_generated_ = false;
  std::string                      title_;
  std::string                      stage_;
  ScopedSettings                   scoped_;
  uint64_t                         saves_ = 0;

  std::array<std::vector<TaskOutputRevision>, registry::kTaskCount> outputs_;
};

} // namespace proposal::session
