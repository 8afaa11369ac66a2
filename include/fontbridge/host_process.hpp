#pragma once

// fontbridge/host_process.hpp — Spawn, supervise and terminate one host process.
//
// The child runs in its own session/process group (setsid), so termination
// signals reach anything the host itself forks.
//
// Termination state machine on deadline:
//   running
//     → terminating_graceful   SIGTERM to the group, wait ≤ grace_period_ms
//     → terminating_forced     SIGKILL to the group, wait ≤ kill_wait_ms
//     → leaked                 final SIGKILL, non-blocking reap, error logged
// Terminal states: exited (reaped on its own or after SIGTERM), killed
// (reaped after SIGKILL), leaked. run_host_process() always returns after at
// most timeout + grace_period + kill_wait (plus polling slack).

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "fontbridge/types.hpp"

namespace fontbridge {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;  // arguments after argv[0]
  std::string cwd;
  std::map<std::string, std::string> env;
  uint64_t timeout_ms{10000};
  uint64_t grace_period_ms{5000};
  uint64_t kill_wait_ms{1000};
  std::size_t max_capture_bytes{65536};
};

struct ProcessResult {
  bool spawned{false};
  std::string spawn_error;        // errno text when spawned == false
  bool timed_out{false};
  int exit_code{-1};              // 128+signal when killed by a signal
  int term_signal{0};
  ProcessState final_state{ProcessState::not_started};
  std::string stdout_text;
  std::string stderr_text;
  bool stdout_truncated{false};
  bool stderr_truncated{false};
  uint64_t run_ns{0};
  int pid{-1};
};

ProcessResult run_host_process(const ProcessSpec &spec);

// Environment variable names that look like credentials.
bool is_secret_key(const std::string &key);

// The current process environment minus secret-looking variables.
std::map<std::string, std::string> host_environment();

} // namespace fontbridge
