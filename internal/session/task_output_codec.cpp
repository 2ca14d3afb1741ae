#include "task_output_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace proposal::session {

namespace {

state::StateUpdate Restrict(const state::ProjectState& source, registry::TaskId id) {
  state::StateUpdate update;
  update.keys = registry::Describe(id).outputs;
  state::Merge(update.values, {source, update.keys});
  return update;
}

} // namespace

std::string EncodeTaskOutput(const state::ProjectState& state, registry::TaskId id) {
  const auto partial = Restrict(state, id);

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(partial.values, &json, options);
  if (!status.ok()) {
    throw util::InvalidState("cannot encode output of " + std::string(registry::TaskName(id)) + ": " +
                             std::string(status.message()));
  }
  return json;
}

state::StateUpdate DecodeTaskOutput(const std::string& content, registry::TaskId id) {
  state::ProjectState parsed;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(content, &parsed, options);
  if (!status.ok()) {
    throw util::InvalidState("stored output of " + std::string(registry::TaskName(id)) +
                             " is not readable: " + std::string(status.message()));
  }
  return Restrict(parsed, id);
}

} // namespace proposal::session
