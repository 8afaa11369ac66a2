#pragma once

// fontbridge/bridge.hpp — Script Execution Bridge.
//
// Runs one assembled script inside the host application and returns a tagged
// ExecutionResult. Per call:
//
//   queued → preparing → running → (completed | timed_out → terminating)
//          → returning
//
// GUARANTEES:
//   - At most config.max_concurrency host processes exist at any instant.
//   - Every call returns within clamp(timeout) + grace_period + kill_wait plus
//     its queue wait, whatever the host does.
//   - The gate slot is released and the work area removed on every path.
//   - Failure text in the result has passed through sanitize_error().
//   - execute() does not throw for anything the host does. Only allocation
//     failures can escape.
//
// RESULT PRECEDENCE:
//   The output file is authoritative only when the host exited with status 0.
//   A non-zero exit or a signal is host_execution_failed even when the file
//   reports success. A missing or non-boolean "success" is a failure. A file
//   that is not a JSON object is malformed_result.

#include <cstdint>
#include <optional>
#include <string>

#include "fontbridge/concurrency_gate.hpp"
#include "fontbridge/config.hpp"
#include "fontbridge/host_locator.hpp"
#include "fontbridge/observability.hpp"
#include "fontbridge/types.hpp"

namespace fontbridge {

class ExecutionBridge {
public:
  static constexpr std::size_t kMaxOutputFileBytes = 16u * 1024 * 1024;

  // Throws ConfigError when config.max_concurrency is 0.
  ExecutionBridge(BridgeConfig config, HostPath host);
  ExecutionBridge(const ExecutionBridge &) = delete;
  ExecutionBridge &operator=(const ExecutionBridge &) = delete;

  // timeout_ms defaults to config.default_timeout_ms; either way it is
  // clamped to config.max_timeout_ms. operation labels the emitted event.
  ExecutionResult execute(const std::string &script_body,
                          std::optional<uint64_t> timeout_ms = std::nullopt,
                          const std::string &operation = "exec");

  uint64_t effective_timeout_ms(std::optional<uint64_t> requested) const;

  const BridgeConfig &config() const { return config_; }
  const HostPath &host() const { return host_; }
  const ConcurrencyGate &gate() const { return gate_; }
  BridgeStats &stats() { return stats_; }
  const BridgeStats &stats() const { return stats_; }

private:
  ExecutionResult fail(ErrorCode code, const std::string &raw_error) const;

  const BridgeConfig config_;
  const HostPath host_;
  ConcurrencyGate gate_;
  BridgeStats stats_;
};

// Interprets a finished host run. Exposed for tests.
//   output_file: file contents, or nullopt when the host wrote none.
ExecutionResult interpret_host_run(const std::optional<std::string> &output_file,
                                   int exit_code, int term_signal,
                                   const std::string &stdout_text,
                                   const std::string &stderr_text,
                                   const BridgeConfig &config);

} // namespace fontbridge
