#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/llm/language_model.hpp"

namespace proposal::testing {

/*
  Writes "<section> for <idea>" for every section. Sections listed in
  `failing` throw; `delays` slow a section down to shape completion order.
*/
class FakeGenerationBackend final : public llm::GenerationBackend {
 public:
  std::string Generate(const llm::GenerationRequest& request) override {
    {
      std::lock_guard lock(mutex_);
      requests_.push_back(request);
    }

    if (auto it = delays_.find(request.section); it != delays_.end()) {
      std::this_thread::sleep_for(it->second);
    }
    if (failing_.count(request.section) > 0) {
      throw std::runtime_error("backend rejected " + request.section);
    }
    if (auto it = answers_.find(request.section); it != answers_.end()) {
      return it->second;
    }
    auto idea = request.inputs.count("initial_idea") ? request.inputs.at("initial_idea") : std::string("?");
    return request.section + " for " + idea;
  }

  void Fail(const std::string& section) {
    failing_.insert(section);
  }

  void Delay(const std::string& section, std::chrono::milliseconds delay) {
    delays_[section] = delay;
  }

  void Answer(const std::string& section, std::string text) {
    answers_[section] = std::move(text);
  }

  std::vector<llm::GenerationRequest> Requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  std::vector<llm::GenerationRequest> RequestsFor(const std::string& section) const {
    std::lock_guard lock(mutex_);
    std::vector<llm::GenerationRequest> out;
    for (const auto& r : requests_) {
      if (r.section == section) out.push_back(r);
    }
    return out;
  }

 private:
  mutable std::mutex                                  mutex_;
  std::vector<llm::GenerationRequest>                 requests_;
  std::set<std::string>                               failing_;
  std::map<std::string, std::chrono::milliseconds>    delays_;
  std::map<std::string, std::string>                  answers_;
};

// Returns a canned answer, or throws when `fail` is set.
class FakeClassificationBackend final : public llm::ClassificationBackend {
 public:
  explicit FakeClassificationBackend(std::string answer = {}) : answer_(std::move(answer)) {}

  std::string Classify(const llm::ClassificationRequest& request) override {
    std::lock_guard lock(mutex_);
    requests_.push_back(request);
    if (fail_) throw std::runtime_error("classifier unavailable");
    return answer_;
  }

  void SetAnswer(std::string answer) {
    std::lock_guard lock(mutex_);
    answer_ = std::move(answer);
    fail_   = false;
  }

  void SetFailing() {
    std::lock_guard lock(mutex_);
    fail_ = true;
  }

  std::size_t calls() const {
    std::lock_guard lock(mutex_);
    return requests_.size();
  }

  llm::ClassificationRequest last() const {
    std::lock_guard lock(mutex_);
    return requests_.back();
  }

 private:
  mutable std::mutex                      mutex_;
  std::string                             answer_;
  bool                                    fail_ = false;
  std::vector<llm::ClassificationRequest> requests_;
};

} // namespace proposal::testing
