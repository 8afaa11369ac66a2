#pragma once

// fontbridge/config.hpp — Bridge configuration.
//
// Layering (later layers override earlier ones):
//   defaults → FONTBRIDGE_* environment → JSON config file → CLI flags
//
// Environment keys:
//   FONTBRIDGE_HOST_PATH, FONTBRIDGE_MAX_CONCURRENCY, FONTBRIDGE_MAX_TIMEOUT_MS,
//   FONTBRIDGE_DEFAULT_TIMEOUT_MS, FONTBRIDGE_GRACE_PERIOD_MS,
//   FONTBRIDGE_KILL_WAIT_MS, FONTBRIDGE_MAX_REQUEST_BYTES,
//   FONTBRIDGE_MAX_ERROR_CHARS, FONTBRIDGE_MAX_CAPTURE_BYTES,
//   FONTBRIDGE_STRICT_ERRORS, FONTBRIDGE_WORK_ROOT
//
// The JSON file uses the same names without the prefix, lower-cased
// (e.g. {"max_concurrency": 2, "strict_errors": true}).

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "fontbridge/jsonlite.hpp"

namespace fontbridge {

struct BridgeConfig {
  std::string host_path;              // empty → Host Locator searches
  std::size_t max_concurrency{3};
  uint64_t max_timeout_ms{10000};
  uint64_t default_timeout_ms{30000}; // clamped to max_timeout_ms per call
  uint64_t grace_period_ms{5000};
  uint64_t kill_wait_ms{1000};
  std::size_t max_request_bytes{1000000};
  std::size_t max_error_chars{300};
  std::size_t max_capture_bytes{65536};
  std::size_t max_pending_requests{32}; // RPC dispatch threads alive at once
  bool strict_errors{false};
  std::string work_root;              // empty → system temp directory

  // Applies FONTBRIDGE_* variables on top of *this. Throws ConfigError on
  // unparsable numbers.
  void apply_env();

  // Applies a JSON config object on top of *this. Throws ConfigError when
  // validate_config() reports errors.
  void apply_json(const std::string &json_text);

  // defaults + environment.
  static BridgeConfig from_env();

  // defaults + JSON text.
  static BridgeConfig from_json(const std::string &json_text);

  jsonlite::Value to_value() const;
};

struct ConfigValidationResult {
  bool ok{false};
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

// Checks a JSON config document without applying it. Unknown keys are
// warnings; wrong types and out-of-range values are errors.
ConfigValidationResult validate_config(const std::string &config_json);

// Checks an assembled config (e.g. after CLI overrides).
ConfigValidationResult validate_config(const BridgeConfig &config);

} // namespace fontbridge
