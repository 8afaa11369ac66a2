#include "fontbridge/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace fontbridge {

namespace {

struct LogSink {
  std::mutex mu;
  LogLevel min_level{LogLevel::info};
  std::string file_path;
  bool initialized{false};
};

LogSink &sink() {
  static LogSink inst;
  return inst;
}

void init_locked(LogSink &s) {
  if (const char *lvl = std::getenv("FONTBRIDGE_LOG_LEVEL"))
    s.min_level = parse_log_level(lvl);
  if (const char *file = std::getenv("FONTBRIDGE_LOG_FILE"))
    s.file_path = file;
  s.initialized = true;
}

uint64_t now_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
}

} // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info: return "info";
    case LogLevel::warn: return "warn";
    case LogLevel::error: return "error";
  }
  return "info";
}

LogLevel parse_log_level(const std::string &text) {
  if (text == "debug") return LogLevel::debug;
  if (text == "warn") return LogLevel::warn;
  if (text == "error") return LogLevel::error;
  return LogLevel::info;
}

void init_logging_from_env() {
  auto &s = sink();
  std::lock_guard<std::mutex> lk(s.mu);
  s.min_level = LogLevel::info;
  s.file_path.clear();
  init_locked(s);
}

void log_event(LogLevel level, const std::string &channel,
               const std::string &event, jsonlite::Object fields) {
  auto &s = sink();
  std::lock_guard<std::mutex> lk(s.mu);
  if (!s.initialized)
    init_locked(s);
  if (static_cast<int>(level) < static_cast<int>(s.min_level))
    return;

  jsonlite::Object rec;
  rec["ts_ms"] = now_ms();
  rec["level"] = to_string(level);
  rec["channel"] = channel;
  rec["event"] = event;
  rec["fields"] = jsonlite::Value{std::move(fields)};
  std::string line = jsonlite::to_json(jsonlite::Value{std::move(rec)});
  line += '\n';

  if (!s.file_path.empty()) {
    if (FILE *f = std::fopen(s.file_path.c_str(), "a")) {
      std::fwrite(line.data(), 1, line.size(), f);
      std::fclose(f);
      return;
    }
    // Unwritable log file: fall through to stderr rather than lose the record.
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fflush(stderr);
}

} // namespace fontbridge
