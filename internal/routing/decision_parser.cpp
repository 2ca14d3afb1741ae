#include "decision_parser.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include "internal/util/errors.hpp"
#include "proposal/orchestrator/v1.hpp"

namespace proposal::routing {

namespace {

namespace v1 = proposal::orchestrator::v1;
using google::protobuf::Value;

constexpr std::string_view kFence = "```";

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end   = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return std::string(text.substr(begin, end - begin));
}

std::string FormatNumber(double number) {
  std::ostringstream out;
  if (std::floor(number) == number && std::fabs(number) < 1e15) {
    out << std::fixed << std::setprecision(0) << number;
  } else {
    out << number;
  }
  return out.str();
}

// "$1,200.50" -> 1200.5; nullopt when anything but a number remains.
std::optional<double> ParseNumber(std::string_view text) {
  std::string digits;
  for (char c : Trim(text)) {
    if (c == '$' || c == ',') continue;
    digits.push_back(c);
  }
  if (digits.empty()) return std::nullopt;

  char*        end   = nullptr;
  const double value = std::strtod(digits.c_str(), &end);
  if (end == nullptr || *end != '\0' || !std::isfinite(value)) return std::nullopt;
  return value;
}

std::optional<std::string> TextOf(const Value& value) {
  switch (value.kind_case()) {
    case Value::kStringValue: {
      auto text = Trim(value.string_value());
      if (text.empty()) return std::nullopt;
      return text;
    }
    case Value::kNumberValue:
      return FormatNumber(value.number_value());
    default:
      return std::nullopt;
  }
}

ExtractedRate RateOf(const Value& value) {
  ExtractedRate rate;
  switch (value.kind_case()) {
    case Value::kNumberValue:
      rate.value = value.number_value();
      rate.raw   = FormatNumber(value.number_value());
      break;

    case Value::kStringValue:
      rate.raw   = value.string_value();
      rate.value = ParseNumber(value.string_value());
      break;

    case Value::kStructValue: {
      const auto& fields = value.struct_value().fields();
      if (auto it = fields.find("value"); it != fields.end()) {
        rate = RateOf(it->second);
      }
      if (auto it = fields.find("unit"); it != fields.end() && it->second.kind_case() == Value::kStringValue) {
        rate.unit = Trim(it->second.string_value());
      }
      break;
    }

    default:
      break;
  }
  return rate;
}

ExtractedSettings SettingsOf(const v1::ExtractedSettingsWire& wire) {
  ExtractedSettings settings;
  for (const auto& [role, value] : wire.rates()) {
    settings.rates.emplace(role, RateOf(value));
  }
  if (wire.has_budget()) settings.budget = TextOf(wire.budget());
  if (wire.has_timeline()) settings.timeline = TextOf(wire.timeline());
  return settings;
}

void AddTask(RoutingDecision& decision, const std::string& name) {
  if (auto id = registry::ParseTaskId(name)) {
    decision.task_ids.Insert(*id);
    return;
  }
  auto& unresolved = decision.unresolved_task_ids;
  if (std::find(unresolved.begin(), unresolved.end(), name) == unresolved.end()) {
    unresolved.push_back(name);
  }
}

void AddSection(RoutingDecision& decision, const std::string& name) {
  auto& sections = decision.relevant_sections;
  if (std::find(sections.begin(), sections.end(), name) == sections.end()) {
    sections.push_back(name);
  }
}

} // namespace

std::string StripCodeFence(std::string_view raw) {
  const auto open = raw.find(kFence);
  if (open == std::string_view::npos) return Trim(raw);

  auto body = raw.substr(open + kFence.size());
  if (body.substr(0, 4) == "json") body.remove_prefix(4);

  const auto close = body.find(kFence);
  if (close != std::string_view::npos) body = body.substr(0, close);
  return Trim(body);
}

RoutingDecision ParseDecision(std::string_view raw) {
  const auto json = StripCodeFence(raw);
  if (json.empty()) throw util::RoutingParseError("empty classifier output");

  v1::RoutingDecisionWire wire;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &wire, options);
  if (!status.ok()) {
    throw util::RoutingParseError("malformed classifier output: " + std::string(status.message()));
  }

  RoutingDecision decision;
  decision.source                = DecisionSource::kClassifier;
  decision.reasoning             = wire.reasoning();
  decision.confidence            = wire.confidence();
  decision.needs_full_generation = wire.needs_full_generation() || wire.needs_proposal_generation();
  decision.extracted_settings    = SettingsOf(wire.extracted_settings());

  for (const auto& name : wire.task_ids()) AddTask(decision, name);
  for (const auto& name : wire.agents_to_rerun()) AddTask(decision, name);
  for (const auto& name : wire.relevant_sections()) AddSection(decision, name);
  for (const auto& name : wire.relevant_context_sections()) AddSection(decision, name);

  if (wire.action().empty()) {
    if (decision.needs_full_generation) {
      decision.action = Action::kGenerate;
    } else if (!decision.task_ids.Empty() || !decision.unresolved_task_ids.empty()) {
      decision.action = Action::kEdit;
    } else {
      decision.action = Action::kConversation;
    }
    return decision;
  }

  auto action = ParseAction(wire.action());
  if (!action) throw util::RoutingParseError("unknown action: " + wire.action());
  decision.action = *action;
  return decision;
}

} // namespace proposal::routing
