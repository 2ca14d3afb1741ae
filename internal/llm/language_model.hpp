#pragma once

#include <map>
#include <string>
#include <vector>

namespace proposal::llm {

/*
  One section-writing call.

  `inputs` holds the named context the section is written from (idea,
  upstream sections, rates). `previous_content` is the current text of
  the section when it is being rewritten, empty otherwise.
*/
struct GenerationRequest {
  std::string                        task;
  std::string                        section;
  std::map<std::string, std::string> inputs;
  std::string                        previous_content;
  std::string                        instructions;
};

struct CatalogueEntry {
  std::string              task;
  std::string              description;
  std::vector<std::string> sections;
};

struct ClassificationRequest {
  std::string                 utterance;
  bool                        document_exists = false;
  std::string                 current_stage;
  std::vector<std::string>    history;
  std::vector<CatalogueEntry> catalogue;
  std::vector<std::string>    roles;
};

/*
  Backends are called from worker threads concurrently and must be
  thread-safe. Timeouts and retries are theirs to enforce; any
  std::exception they throw is treated as a failed call.
*/
class GenerationBackend {
 public:
  virtual ~GenerationBackend() = default;

  virtual std::string Generate(const GenerationRequest& request) = 0;
};

// Returns the raw structured classification (JSON, optionally fenced).
class ClassificationBackend {
 public:
  virtual ~ClassificationBackend() = default;

  virtual std::string Classify(const ClassificationRequest& request) = 0;
};

} // namespace proposal::llm
