#pragma once

// fontbridge/log.hpp — Structured JSONL diagnostic log.
//
// One JSON object per line:
//   {"channel":"bridge","event":"host_exit","fields":{...},"level":"info","ts_ms":...}
//
// Sink: stderr by default, or the file named by FONTBRIDGE_LOG_FILE (append).
// stdout is never written: it carries the RPC stream.
//
// Channels in use: "bridge", "security", "rpc", "config".
//
// INVARIANT: unredacted host error text is only ever logged at debug level on
// the "bridge" channel. Callers must not put it on any other channel.

#include <string>

#include "fontbridge/jsonlite.hpp"

namespace fontbridge {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

std::string to_string(LogLevel level);

// Parses "debug|info|warn|error" (case-sensitive). Unknown text yields info.
LogLevel parse_log_level(const std::string &text);

// Reads FONTBRIDGE_LOG_LEVEL and FONTBRIDGE_LOG_FILE. Called lazily on first
// log_event(); call explicitly to pick up environment changes (tests).
void init_logging_from_env();

// Thread-safe. Never throws.
void log_event(LogLevel level, const std::string &channel,
               const std::string &event, jsonlite::Object fields = {});

} // namespace fontbridge
