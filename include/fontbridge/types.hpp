#pragma once

// fontbridge/types.hpp — Core data structures and error taxonomy.
//
// ERROR CHANNELS:
//   Two channels, never mixed:
//     1. Thrown (fontbridge::Error subclasses) — conditions detected before any
//        host process exists: rejected caller input, unusable configuration,
//        programmer errors (unknown operation, unbound template placeholder).
//     2. Returned (ExecutionResult with ok=false) — everything that happens
//        once the bridge has accepted a script: timeouts, host failures,
//        malformed output. execute() never throws for these.
//
// MEMORY OWNERSHIP:
//   All members are value-owned. ExecutionResult is returned by value and is
//   safe to move across threads.

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "fontbridge/jsonlite.hpp"

namespace fontbridge {

enum class ErrorCode {
  none,
  validation_failed,
  request_too_large,
  timeout,
  host_execution_failed,
  malformed_result,
  spawn_failed,
  work_area_failed,
};

std::string to_string(ErrorCode code);

// ---------------------------------------------------------------------------
// Thrown errors
// ---------------------------------------------------------------------------
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Caller input rejected before any process is spawned. Always recoverable and
// always reported to the caller with the field and reason.
class ValidationError : public Error {
public:
  ValidationError(std::string field, std::string reason);

  const std::string &field() const noexcept { return field_; }
  const std::string &reason() const noexcept { return reason_; }

private:
  std::string field_;
  std::string reason_;
};

// Argument payload above the size ceiling. Reported with a generic message.
class RequestSizeError : public Error {
public:
  RequestSizeError(std::size_t actual_bytes, std::size_t max_bytes);

  std::size_t actual_bytes() const noexcept { return actual_bytes_; }
  std::size_t max_bytes() const noexcept { return max_bytes_; }

private:
  std::size_t actual_bytes_;
  std::size_t max_bytes_;
};

// No usable host executable. Fatal at startup.
class HostNotFoundError : public Error {
public:
  using Error::Error;
};

class ConfigError : public Error {
public:
  using Error::Error;
};

// A template was rendered with missing or unexpected bindings.
class TemplateError : public Error {
public:
  using Error::Error;
};

// Tool or resource name not in the catalog. Propagates to the RPC layer as a
// protocol error rather than a tool failure.
class UnknownOperationError : public Error {
public:
  explicit UnknownOperationError(std::string name);

  const std::string &name() const noexcept { return name_; }

private:
  std::string name_;
};

// ---------------------------------------------------------------------------
// Host process lifecycle
// ---------------------------------------------------------------------------
enum class ProcessState {
  not_started,
  running,
  terminating_graceful,
  terminating_forced,
  exited,  // reaped after exiting on its own or after SIGTERM
  killed,  // reaped after SIGKILL
  leaked,  // SIGKILL sent, still not reaped within the bounded window
};

std::string to_string(ProcessState state);

// ---------------------------------------------------------------------------
// Per-execution metrics
// ---------------------------------------------------------------------------
struct ExecutionMetrics {
  uint64_t queue_wait_ns{0};   // Time spent waiting for a gate slot
  uint64_t run_ns{0};          // Spawn to reap (or give-up)
  uint64_t total_ns{0};        // Whole execute() call
  size_t   script_bytes{0};
  size_t   bytes_stdout{0};
  size_t   bytes_stderr{0};
};

// ---------------------------------------------------------------------------
// ExecutionResult — tagged outcome of one bridge call.
// ---------------------------------------------------------------------------
// ok == true  → data holds the host's "data" value (null when absent) and
//               error is empty.
// ok == false → error holds sanitized text and error_code names the failure.
// stdout_text/stderr_text are set only on the fallback path (no output file).
struct ExecutionResult {
  bool ok{false};
  jsonlite::Value data;
  std::string message;
  std::string error;
  ErrorCode error_code{ErrorCode::none};
  int exit_code{0};
  ProcessState final_state{ProcessState::not_started};
  std::optional<std::string> stdout_text;
  std::optional<std::string> stderr_text;
  std::string execution_id;
  ExecutionMetrics metrics;

  bool timed_out() const { return error_code == ErrorCode::timeout; }

  static ExecutionResult success(jsonlite::Value data, std::string message = "");
  static ExecutionResult failure(ErrorCode code, std::string error);
};

// The shape returned to RPC callers:
//   {"success": true, "data": ..., "message"?: ...}
//   {"success": false, "error": "...", "error_code": "..."}
// plus "stdout"/"stderr" when present.
jsonlite::Value result_to_value(const ExecutionResult &result);

} // namespace fontbridge
