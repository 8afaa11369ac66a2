#include "fontbridge/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <variant>

#include "fontbridge/types.hpp"

namespace fontbridge {

namespace {

struct NumericKey {
  const char *name;
  uint64_t min;
  uint64_t max;
};

constexpr NumericKey kNumericKeys[] = {
    {"max_concurrency", 1, 64},
    {"max_timeout_ms", 1, 600000},
    {"default_timeout_ms", 1, 3600000},
    {"grace_period_ms", 0, 60000},
    {"kill_wait_ms", 0, 60000},
    {"max_request_bytes", 1, 64ull * 1024 * 1024},
    {"max_error_chars", 16, 10000},
    {"max_capture_bytes", 1024, 16ull * 1024 * 1024},
    {"max_pending_requests", 1, 1024},
};

const NumericKey *find_numeric(const std::string &key) {
  for (const auto &k : kNumericKeys)
    if (key == k.name)
      return &k;
  return nullptr;
}

bool is_string_key(const std::string &key) {
  return key == "host_path" || key == "work_root";
}

void set_numeric(BridgeConfig &c, const std::string &key, uint64_t v) {
  if (key == "max_concurrency") c.max_concurrency = static_cast<std::size_t>(v);
  else if (key == "max_timeout_ms") c.max_timeout_ms = v;
  else if (key == "default_timeout_ms") c.default_timeout_ms = v;
  else if (key == "grace_period_ms") c.grace_period_ms = v;
  else if (key == "kill_wait_ms") c.kill_wait_ms = v;
  else if (key == "max_request_bytes") c.max_request_bytes = static_cast<std::size_t>(v);
  else if (key == "max_error_chars") c.max_error_chars = static_cast<std::size_t>(v);
  else if (key == "max_capture_bytes") c.max_capture_bytes = static_cast<std::size_t>(v);
  else if (key == "max_pending_requests") c.max_pending_requests = static_cast<std::size_t>(v);
}

uint64_t get_numeric(const BridgeConfig &c, const std::string &key) {
  if (key == "max_concurrency") return c.max_concurrency;
  if (key == "max_timeout_ms") return c.max_timeout_ms;
  if (key == "default_timeout_ms") return c.default_timeout_ms;
  if (key == "grace_period_ms") return c.grace_period_ms;
  if (key == "kill_wait_ms") return c.kill_wait_ms;
  if (key == "max_request_bytes") return c.max_request_bytes;
  if (key == "max_error_chars") return c.max_error_chars;
  if (key == "max_capture_bytes") return c.max_capture_bytes;
  if (key == "max_pending_requests") return c.max_pending_requests;
  return 0;
}

std::string env_name(const std::string &key) {
  std::string out = "FONTBRIDGE_";
  for (char ch : key)
    out.push_back(ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - 'a' + 'A') : ch);
  return out;
}

bool parse_env_bool(const std::string &key, const std::string &text) {
  if (text == "1" || text == "true" || text == "yes") return true;
  if (text == "0" || text == "false" || text == "no" || text.empty()) return false;
  throw ConfigError(env_name(key) + ": expected a boolean, got '" + text + "'");
}

uint64_t parse_env_u64(const std::string &key, const std::string &text) {
  if (text.empty() || text[0] == '-' || text[0] == '+')
    throw ConfigError(env_name(key) + ": expected a non-negative integer");
  errno = 0;
  char *end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0')
    throw ConfigError(env_name(key) + ": expected a non-negative integer, got '" +
                      text + "'");
  return static_cast<uint64_t>(v);
}

void check_range(const NumericKey &k, uint64_t v,
                 std::vector<std::string> &errors) {
  if (v < k.min || v > k.max)
    errors.push_back(std::string(k.name) + " out of range [" +
                     std::to_string(k.min) + ", " + std::to_string(k.max) +
                     "]: " + std::to_string(v));
}

} // namespace

void BridgeConfig::apply_env() {
  if (const char *e = std::getenv("FONTBRIDGE_HOST_PATH"); e && e[0])
    host_path = e;
  if (const char *e = std::getenv("FONTBRIDGE_WORK_ROOT"); e && e[0])
    work_root = e;
  if (const char *e = std::getenv("FONTBRIDGE_STRICT_ERRORS"))
    strict_errors = parse_env_bool("strict_errors", e);
  for (const auto &k : kNumericKeys) {
    const std::string name = env_name(k.name);
    const char *e = std::getenv(name.c_str());
    if (!e || !e[0])
      continue;
    set_numeric(*this, k.name, parse_env_u64(k.name, e));
  }
  const auto check = validate_config(*this);
  if (!check.ok)
    throw ConfigError("invalid environment configuration: " + check.errors.front());
}

void BridgeConfig::apply_json(const std::string &json_text) {
  const auto check = validate_config(json_text);
  if (!check.ok)
    throw ConfigError("invalid config: " + check.errors.front());

  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(json_text, &err);
  for (const auto &[key, value] : obj) {
    if (const NumericKey *k = find_numeric(key)) {
      set_numeric(*this, k->name, std::get<std::uint64_t>(value.v));
    } else if (key == "host_path") {
      host_path = std::get<std::string>(value.v);
    } else if (key == "work_root") {
      work_root = std::get<std::string>(value.v);
    } else if (key == "strict_errors") {
      strict_errors = std::get<bool>(value.v);
    }
  }
}

BridgeConfig BridgeConfig::from_env() {
  BridgeConfig c;
  c.apply_env();
  return c;
}

BridgeConfig BridgeConfig::from_json(const std::string &json_text) {
  BridgeConfig c;
  c.apply_json(json_text);
  return c;
}

jsonlite::Value BridgeConfig::to_value() const {
  jsonlite::Object o;
  o["host_path"] = host_path;
  o["work_root"] = work_root;
  o["strict_errors"] = strict_errors;
  for (const auto &k : kNumericKeys)
    o[k.name] = get_numeric(*this, k.name);
  return jsonlite::Value{std::move(o)};
}

ConfigValidationResult validate_config(const std::string &config_json) {
  ConfigValidationResult r;
  std::optional<jsonlite::JsonError> err;
  const auto obj = jsonlite::parse(config_json, &err);
  if (err) {
    r.errors.push_back("config is not a valid JSON object: " + err->code);
    return r;
  }
  for (const auto &[key, value] : obj) {
    if (const NumericKey *k = find_numeric(key)) {
      if (!value.is_integer() || std::holds_alternative<std::int64_t>(value.v)) {
        r.errors.push_back(key + " must be a non-negative integer");
        continue;
      }
      check_range(*k, std::get<std::uint64_t>(value.v), r.errors);
    } else if (is_string_key(key)) {
      if (!value.is_string())
        r.errors.push_back(key + " must be a string");
    } else if (key == "strict_errors") {
      if (!value.is_bool())
        r.errors.push_back(key + " must be a boolean");
    } else {
      r.warnings.push_back("unknown config key: " + key);
    }
  }
  r.ok = r.errors.empty();
  return r;
}

ConfigValidationResult validate_config(const BridgeConfig &config) {
  ConfigValidationResult r;
  for (const auto &k : kNumericKeys)
    check_range(k, get_numeric(config, k.name), r.errors);
  if (config.default_timeout_ms > config.max_timeout_ms)
    r.warnings.push_back("default_timeout_ms exceeds max_timeout_ms and will be clamped");
  r.ok = r.errors.empty();
  return r;
}

} // namespace fontbridge
