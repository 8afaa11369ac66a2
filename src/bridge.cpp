#include "fontbridge/bridge.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>

#include "fontbridge/hash.hpp"
#include "fontbridge/host_process.hpp"
#include "fontbridge/log.hpp"
#include "fontbridge/sanitize.hpp"
#include "fontbridge/work_area.hpp"

namespace fontbridge {

namespace {

SanitizeOptions sanitize_options(const BridgeConfig &config) {
  SanitizeOptions o;
  o.max_chars = config.max_error_chars;
  o.strict = config.strict_errors;
  return o;
}

ExecutionResult sanitized_failure(ErrorCode code, const std::string &raw,
                                  const BridgeConfig &config) {
  return ExecutionResult::failure(code, sanitize_error(raw, sanitize_options(config)));
}

std::string exit_description(int exit_code, int term_signal) {
  if (term_signal != 0)
    return "Host application terminated by signal " + std::to_string(term_signal);
  return "Host application exited with status " + std::to_string(exit_code);
}

// Last non-empty line of stderr, which is where an interpreter puts the
// exception message.
std::string stderr_summary(const std::string &stderr_text) {
  std::size_t end = stderr_text.find_last_not_of(" \t\r\n");
  if (end == std::string::npos)
    return "";
  const std::size_t nl = stderr_text.rfind('\n', end);
  const std::size_t start = nl == std::string::npos ? 0 : nl + 1;
  return stderr_text.substr(start, end - start + 1);
}

} // namespace

ExecutionResult interpret_host_run(const std::optional<std::string> &output_file,
                                   int exit_code, int term_signal,
                                   const std::string &stdout_text,
                                   const std::string &stderr_text,
                                   const BridgeConfig &config) {
  const bool exited_clean = exit_code == 0 && term_signal == 0;

  if (!output_file) {
    // Fallback: the host did not honour the output-file contract.
    ExecutionResult r;
    if (exited_clean) {
      r = ExecutionResult::success(jsonlite::Value{nullptr});
    } else {
      const std::string summary = stderr_summary(stderr_text);
      r = sanitized_failure(ErrorCode::host_execution_failed,
                            summary.empty() ? exit_description(exit_code, term_signal)
                                            : summary,
                            config);
    }
    r.stdout_text = sanitize_stream_text(stdout_text, config.max_capture_bytes);
    r.stderr_text = sanitize_stream_text(stderr_text, config.max_capture_bytes);
    r.exit_code = exit_code;
    return r;
  }

  std::optional<jsonlite::JsonError> err;
  jsonlite::Value parsed = jsonlite::parse_value(*output_file, &err);
  if (err) {
    log_event(LogLevel::error, "bridge", "malformed_result",
              {{"code", jsonlite::Value{err->code}},
               {"message", jsonlite::Value{err->message}},
               {"exit_code", exit_code}});
    ExecutionResult r = ExecutionResult::failure(
        ErrorCode::malformed_result, "Host returned a malformed result");
    r.exit_code = exit_code;
    return r;
  }
  if (!parsed.is_object()) {
    log_event(LogLevel::error, "bridge", "malformed_result",
              {{"code", jsonlite::Value{"json_not_object"}},
               {"exit_code", exit_code}});
    ExecutionResult r = ExecutionResult::failure(
        ErrorCode::malformed_result, "Host returned a malformed result");
    r.exit_code = exit_code;
    return r;
  }

  const auto &obj = std::get<jsonlite::Object>(parsed.v);
  const jsonlite::Value *success = jsonlite::find(obj, "success");
  const std::string reported_error = jsonlite::get_string(obj, "error", "");
  const std::string message = jsonlite::get_string(obj, "message", "");

  ExecutionResult r;
  if (!exited_clean) {
    const bool claimed_success =
        success && success->is_bool() && std::get<bool>(success->v);
    if (claimed_success)
      log_event(LogLevel::warn, "bridge", "exit_status_overrides_result",
                {{"exit_code", exit_code}, {"signal", term_signal}});
    r = sanitized_failure(ErrorCode::host_execution_failed,
                          !claimed_success && !reported_error.empty()
                              ? reported_error
                              : exit_description(exit_code, term_signal),
                          config);
  } else if (!success || !success->is_bool()) {
    r = sanitized_failure(ErrorCode::host_execution_failed,
                          reported_error.empty()
                              ? "Host result did not report success"
                              : reported_error,
                          config);
  } else if (std::get<bool>(success->v)) {
    const jsonlite::Value *data = jsonlite::find(obj, "data");
    r = ExecutionResult::success(data ? *data : jsonlite::Value{nullptr}, message);
  } else {
    r = sanitized_failure(ErrorCode::host_execution_failed,
                          reported_error.empty() ? "Operation failed" : reported_error,
                          config);
  }
  r.exit_code = exit_code;
  return r;
}

ExecutionBridge::ExecutionBridge(BridgeConfig config, HostPath host)
    : config_(std::move(config)), host_(std::move(host)),
      gate_(config_.max_concurrency) {}

uint64_t ExecutionBridge::effective_timeout_ms(std::optional<uint64_t> requested) const {
  const uint64_t t = requested.value_or(config_.default_timeout_ms);
  return std::clamp<uint64_t>(t, 1, config_.max_timeout_ms);
}

ExecutionResult ExecutionBridge::fail(ErrorCode code,
                                      const std::string &raw_error) const {
  return sanitized_failure(code, raw_error, config_);
}

ExecutionResult ExecutionBridge::execute(const std::string &script_body,
                                         std::optional<uint64_t> timeout_ms,
                                         const std::string &operation) {
  using Clock = std::chrono::steady_clock;
  const auto t_start = Clock::now();
  const uint64_t timeout = effective_timeout_ms(timeout_ms);
  const std::string execution_id = script_digest(script_body);

  BridgeEvent ev;
  ev.execution_id = execution_id;
  ev.operation = operation;
  ev.script_bytes = script_body.size();

  ExecutionResult result;
  ProcessResult proc;
  {
    // queued
    GateSlot slot = gate_.acquire();
    ev.queue_wait_ns = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t_start)
            .count());

    // preparing
    std::optional<SecureWorkArea> area;
    try {
      area.emplace(config_.work_root);
      area->write_script(script_body);
    } catch (const std::system_error &e) {
      log_event(LogLevel::error, "bridge", "work_area_failed",
                {{"execution_id", jsonlite::Value{execution_id}},
                 {"error", jsonlite::Value{e.what()}}});
      result = fail(ErrorCode::work_area_failed,
                    "Failed to prepare execution environment");
    }

    if (area && result.error_code == ErrorCode::none) {
      // running
      ProcessSpec spec;
      spec.command = host_.str();
      spec.argv = {"-script", area->script_path(), "-output", area->output_path()};
      spec.cwd = area->dir();
      spec.env = host_environment();
      spec.timeout_ms = timeout;
      spec.grace_period_ms = config_.grace_period_ms;
      spec.kill_wait_ms = config_.kill_wait_ms;
      spec.max_capture_bytes = config_.max_capture_bytes;

      log_event(LogLevel::debug, "bridge", "host_spawn",
                {{"execution_id", jsonlite::Value{execution_id}},
                 {"timeout_ms", timeout}});
      proc = run_host_process(spec);

      if (!proc.spawned) {
        log_event(LogLevel::error, "bridge", "spawn_failed",
                  {{"execution_id", jsonlite::Value{execution_id}},
                   {"error", jsonlite::Value{proc.spawn_error}}});
        result = fail(ErrorCode::spawn_failed, "Failed to start host application");
      } else if (proc.timed_out) {
        result = fail(ErrorCode::timeout, "Operation timed out after " +
                                              std::to_string(timeout) + " ms");
        result.exit_code = proc.exit_code;
      } else {
        const auto output = area->read_output(kMaxOutputFileBytes);
        ev.used_fallback = !output.has_value();
        result = interpret_host_run(output, proc.exit_code, proc.term_signal,
                                    proc.stdout_text, proc.stderr_text, config_);
      }
    }

    // returning: work area first, then the slot.
    if (area)
      area->remove();
  }

  result.execution_id = execution_id;
  result.final_state = proc.final_state;
  result.metrics.queue_wait_ns = ev.queue_wait_ns;
  result.metrics.run_ns = proc.run_ns;
  result.metrics.script_bytes = script_body.size();
  result.metrics.bytes_stdout = proc.stdout_text.size();
  result.metrics.bytes_stderr = proc.stderr_text.size();
  result.metrics.total_ns = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - t_start)
          .count());

  ev.ok = result.ok;
  ev.error_code = to_string(result.error_code);
  ev.final_state = to_string(proc.final_state);
  ev.exit_code = result.exit_code;
  ev.run_ns = proc.run_ns;
  ev.total_ns = result.metrics.total_ns;
  ev.bytes_stdout = proc.stdout_text.size();
  ev.bytes_stderr = proc.stderr_text.size();
  emit_bridge_event(stats_, ev);

  log_event(result.ok ? LogLevel::info : LogLevel::warn, "bridge", "execution_done",
            {{"execution_id", jsonlite::Value{execution_id}},
             {"operation", jsonlite::Value{operation}},
             {"ok", result.ok},
             {"error_code", jsonlite::Value{ev.error_code}},
             {"final_state", jsonlite::Value{ev.final_state}},
             {"run_ms", proc.run_ns / 1000000u}});
  return result;
}

} // namespace fontbridge
