#include "keyword_table.hpp"

namespace proposal::routing {

using registry::TaskId;

const std::array<TaskKeywords, 5>& KeywordTable() {
  static const std::array<TaskKeywords, 5> kTable = {{
      {TaskId::kScopeRefinement,
       {"idea", "concept", "scope", "requirements", "features", "functionality", "what", "purpose", "goal"}},
      {TaskId::kBusinessAnalyst,
       {"business", "market", "roi", "revenue", "profit", "cost", "benefit", "value", "competition",
        "target audience", "customer"}},
      {TaskId::kTechnicalArchitect,
       {"technical", "technology", "tech stack", "architecture", "framework", "api", "database", "backend",
        "frontend", "server"}},
      {TaskId::kProjectManager,
       {"timeline", "schedule", "deadline", "milestone", "phase", "delivery", "planning", "project plan"}},
      {TaskId::kResourceAllocation,
       {"budget", "cost", "price", "rate", "hourly", "salary", "team", "resource", "engineer", "developer",
        "designer", "dollar", "usd", "money", "expense"}},
  }};
  return kTable;
}

registry::TaskSet MatchKeywords(std::string_view lowered) {
  registry::TaskSet matched;
  for (const auto& entry : KeywordTable()) {
    for (auto keyword : entry.keywords) {
      if (lowered.find(keyword) != std::string_view::npos) {
        matched.Insert(entry.task);
        break;
      }
    }
  }
  return matched;
}

} // namespace proposal::routing
