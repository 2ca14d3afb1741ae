#pragma once

#include <exception>
#include <string>

namespace proposal::util {

/*
  Portable run result codes.

  Pipeline callers never see exception types; the facade translates
  them with ToResult().
*/

enum class ErrorCode {
  OK = 0,

  UnknownTask,
  PrerequisiteFailed,
  TaskFailed,
  Incomplete,
  InvalidState,

  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

Result ToResult(const std::exception& e);

const char* ErrorCodeName(ErrorCode code);

} // namespace proposal::util
