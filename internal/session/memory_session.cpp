#include "memory_session.hpp"

namespace proposal::session {

MemorySession::MemorySession(std::string initial_idea) : initial_idea_(std::move(initial_idea)) {}

std::vector<ConversationMessage> MemorySession::ConversationHistory() const {
  std::lock_guard lock(mutex_);
  return history_;
}

void MemorySession::AppendMessage(ConversationMessage message) {
  std::lock_guard lock(mutex_);
  history_.push_back(std::move(message));
}

bool MemorySession::IsDocumentGenerated() const {
  std::lock_guard lock(mutex_);
  return document_generated_;
}

void MemorySession::SetDocumentGenerated(bool generated) {
  std::lock_guard lock(mutex_);
  document_generated_ = generated;
}

std::string MemorySession::DocumentTitle() const {
  std::lock_guard lock(mutex_);
  return title_;
}

void MemorySession::SetDocumentTitle(std::string title) {
  std::lock_guard lock(mutex_);
  title_ = std::move(title);
}

std::string MemorySession::InitialIdea() const {
  std::lock_guard lock(mutex_);
  return initial_idea_;
}

std::string MemorySession::CurrentStage() const {
  std::lock_guard lock(mutex_);
  return stage_;
}

void MemorySession::SetCurrentStage(std::string stage) {
  std::lock_guard lock(mutex_);
  stage_ = std::move(stage);
}

bool MemorySession::Save() {
  std::lock_guard lock(mutex_);
  ++saves_;
  return true;
}

std::optional<std::string> MemorySession::PriorTaskOutput(registry::TaskId id) const {
  std::lock_guard lock(mutex_);
  const auto& revisions = outputs_[static_cast<std::size_t>(id)];
  if (revisions.empty()) return std::nullopt;
  return revisions.back().content;
}

void MemorySession::SaveTaskOutput(registry::TaskId id, std::string content, std::string reason) {
  std::lock_guard lock(mutex_);
  outputs_[static_cast<std::size_t>(id)].push_back({std::move(content), std::move(reason)});
}

ScopedSettings MemorySession::ScopedState() const {
  std::lock_guard lock(mutex_);
  return scoped_;
}

void MemorySession::SetScopedState(ScopedSettings state) {
  std::lock_guard lock(mutex_);
  scoped_ = std::move(state);
}

std::vector<TaskOutputRevision> MemorySession::Revisions(registry::TaskId id) const {
  std::lock_guard lock(mutex_);
  return outputs_[static_cast<std::size_t>(id)];
}

uint64_t MemorySession::save_count() const {
  std::lock_guard lock(mutex_);
  return saves_;
}

} // namespace proposal::session
