#include "fontbridge/types.hpp"

namespace fontbridge {

std::string to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::none: return "";
    case ErrorCode::validation_failed: return "validation_failed";
    case ErrorCode::request_too_large: return "request_too_large";
    case ErrorCode::timeout: return "timeout";
    case ErrorCode::host_execution_failed: return "host_execution_failed";
    case ErrorCode::malformed_result: return "malformed_result";
    case ErrorCode::spawn_failed: return "spawn_failed";
    case ErrorCode::work_area_failed: return "work_area_failed";
  }
  return "";
}

std::string to_string(ProcessState state) {
  switch (state) {
    case ProcessState::not_started: return "not_started";
    case ProcessState::running: return "running";
    case ProcessState::terminating_graceful: return "terminating_graceful";
    case ProcessState::terminating_forced: return "terminating_forced";
    case ProcessState::exited: return "exited";
    case ProcessState::killed: return "killed";
    case ProcessState::leaked: return "leaked";
  }
  return "";
}

ValidationError::ValidationError(std::string field, std::string reason)
    : Error(field + ": " + reason), field_(std::move(field)),
      reason_(std::move(reason)) {}

RequestSizeError::RequestSizeError(std::size_t actual_bytes,
                                   std::size_t max_bytes)
    : Error("request payload too large (" + std::to_string(actual_bytes) +
            " > " + std::to_string(max_bytes) + " bytes)"),
      actual_bytes_(actual_bytes), max_bytes_(max_bytes) {}

UnknownOperationError::UnknownOperationError(std::string name)
    : Error("unknown operation: " + name), name_(std::move(name)) {}

ExecutionResult ExecutionResult::success(jsonlite::Value data,
                                         std::string message) {
  ExecutionResult r;
  r.ok = true;
  r.data = std::move(data);
  r.message = std::move(message);
  return r;
}

ExecutionResult ExecutionResult::failure(ErrorCode code, std::string error) {
  ExecutionResult r;
  r.ok = false;
  r.error_code = code;
  r.error = std::move(error);
  return r;
}

jsonlite::Value result_to_value(const ExecutionResult &result) {
  jsonlite::Object obj;
  obj["success"] = result.ok;
  if (result.ok) {
    obj["data"] = result.data;
    if (!result.message.empty())
      obj["message"] = result.message;
  } else {
    obj["error"] = result.error.empty() ? std::string("Operation failed")
                                        : result.error;
    obj["error_code"] = to_string(result.error_code);
  }
  if (result.stdout_text)
    obj["stdout"] = *result.stdout_text;
  if (result.stderr_text)
    obj["stderr"] = *result.stderr_text;
  return jsonlite::Value{std::move(obj)};
}

} // namespace fontbridge
