#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <utility>

#include "internal/util/errors.hpp"

namespace proposal::config {

namespace {

constexpr uint32_t kDefaultHistoryTurns      = 5;
constexpr double   kDefaultFallbackConfidence = 0.7;

const char* const kDefaultGenerateTriggers[] = {
    "generate proposal", "generate the proposal", "go ahead",    "proceed",       "create proposal",
    "make proposal",     "let's go",              "lets go",     "start proposal", "build proposal",
};

const char* const kDefaultGenerateCommands[] = {"generate"};

const char* const kDefaultGreetings[] = {
    "hello", "hi", "hey", "greetings", "good", "morning", "afternoon", "evening", "there", "howdy",
};

const std::pair<const char*, double> kDefaultRates[] = {
    {"senior_engineer", 60.0}, {"mid_level_engineer", 45.0}, {"junior_engineer", 30.0}, {"ui_ux_designer", 40.0},
    {"devops_engineer", 55.0}, {"ai_engineer", 65.0},        {"project_manager", 50.0},
};

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

proposal::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  proposal::runtime::config::RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw util::ConfigError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw util::ConfigError("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

proposal::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  proposal::runtime::config::RuntimeConfig config;
  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(proposal::runtime::config::RuntimeConfig& config) {
  auto* workers = config.mutable_workers();
  if (workers->threads() == 0) {
    const auto hw = std::thread::hardware_concurrency();
    workers->set_threads(hw == 0 ? 1 : hw);
  }

  auto* routing = config.mutable_routing();
  if (routing->history_turns() == 0) {
    routing->set_history_turns(kDefaultHistoryTurns);
  }
  if (routing->generate_triggers().empty()) {
    for (const char* trigger : kDefaultGenerateTriggers) {
      routing->add_generate_triggers(trigger);
    }
  }
  if (routing->generate_commands().empty()) {
    for (const char* command : kDefaultGenerateCommands) {
      routing->add_generate_commands(command);
    }
  }
  if (routing->greetings().empty()) {
    for (const char* greeting : kDefaultGreetings) {
      routing->add_greetings(greeting);
    }
  }
  if (routing->fallback_confidence() <= 0.0 || routing->fallback_confidence() > 1.0) {
    routing->set_fallback_confidence(kDefaultFallbackConfidence);
  }

  auto* settings = config.mutable_settings();
  if (settings->currency().empty()) {
    settings->set_currency("USD");
  }
  if (settings->default_rates().empty()) {
    auto& rates = *settings->mutable_default_rates();
    for (const auto& [role, hourly] : kDefaultRates) {
      rates[role] = hourly;
    }
  }
}

} // namespace proposal::config
