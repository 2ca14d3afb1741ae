#include "result.hpp"

#include "internal/util/errors.hpp"

namespace proposal::util {

Result ToResult(const std::exception& e) {
  if (dynamic_cast<const UnknownTask*>(&e)) {
    return Result::Err(ErrorCode::UnknownTask, e.what());
  }
  if (dynamic_cast<const PrerequisiteFailed*>(&e)) {
    return Result::Err(ErrorCode::PrerequisiteFailed, e.what());
  }
  if (dynamic_cast<const TaskExecutionError*>(&e)) {
    return Result::Err(ErrorCode::TaskFailed, e.what());
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return Result::Err(ErrorCode::InvalidState, e.what());
  }

  return Result::Err(ErrorCode::InternalError, e.what());
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::UnknownTask:
      return "unknown_task";
    case ErrorCode::PrerequisiteFailed:
      return "prerequisite_failed";
    case ErrorCode::TaskFailed:
      return "task_failed";
    case ErrorCode::Incomplete:
      return "incomplete";
    case ErrorCode::InvalidState:
      return "invalid_state";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

} // namespace proposal::util
