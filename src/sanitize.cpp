#include "fontbridge/sanitize.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <regex>

#include "fontbridge/log.hpp"

namespace fontbridge {

namespace {

// Path characters are anything but whitespace and punctuation that delimits a
// path in prose. Bytes >= 0x80 are included so UTF-8 names are consumed whole.
const std::regex &unix_path_re() {
  static const std::regex re(R"re(/[^\s"'`(),:;<>\[\]{}]+)re");
  return re;
}

const std::regex &windows_path_re() {
  static const std::regex re(R"re([A-Za-z]:\\[^\s"'`(),:;<>\[\]{}]+)re");
  return re;
}

// A [PATH] token directly joined to other text means the redaction did not
// cover the whole original path.
const std::regex &glued_path_re() {
  static const std::regex re(
      R"re([^\s"'`(),:;<>=\[]\[PATH\]|\[PATH\][^\s"'`(),:;<>.\]])re");
  return re;
}

const std::regex &line_re() {
  static const std::regex re(R"(line \d+)", std::regex::icase);
  return re;
}

const std::regex &colon_line_re() {
  static const std::regex re(R"(:\d+:)");
  return re;
}

constexpr const char *kSensitiveMarkers[] = {
    "/Users/", "/home/", "~/", "C:\\Users", "/tmp/", "/var/folders",
    "/private/var", "AppData\\Local\\Temp", "Traceback", "File \"",
};

std::string to_lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

bool contains_any(const std::string &haystack,
                  std::initializer_list<const char *> needles) {
  for (const char *n : needles)
    if (haystack.find(n) != std::string::npos)
      return true;
  return false;
}

std::string redact(const std::string &text) {
  std::string out = std::regex_replace(text, unix_path_re(), "[PATH]");
  out = std::regex_replace(out, windows_path_re(), "[PATH]");
  out = std::regex_replace(out, line_re(), "line [REDACTED]");
  out = std::regex_replace(out, colon_line_re(), ":[REDACTED]:");
  return out;
}

std::string trim(const std::string &s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos)
    return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

std::string last_nonempty_line(const std::string &text) {
  std::size_t end = text.size();
  while (end > 0) {
    const std::size_t nl = text.rfind('\n', end - 1);
    const std::size_t start = nl == std::string::npos ? 0 : nl + 1;
    std::string line = trim(text.substr(start, end - start));
    if (!line.empty())
      return line;
    if (nl == std::string::npos)
      break;
    end = nl;
  }
  return "";
}

// Cuts at max bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string &s, std::size_t max) {
  if (s.size() <= max)
    return s;
  std::size_t cut = max;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80)
    --cut;
  return s.substr(0, cut);
}

} // namespace

bool has_sensitive_marker(const std::string &text) {
  for (const char *m : kSensitiveMarkers)
    if (text.find(m) != std::string::npos)
      return true;
  return false;
}

std::string categorize_error(const std::string &text) {
  const std::string t = to_lower(text);
  if (contains_any(t, {"permission", "access denied", "not permitted",
                       "unauthorized"}))
    return "Permission denied";
  if (contains_any(t, {"timed out", "timeout"}))
    return "Operation timed out";
  if (contains_any(t, {"not found", "no such", "does not exist", "missing",
                       "no font is currently open"}))
    return "Resource not found";
  if (contains_any(t, {"invalid", "must be", "valueerror", "typeerror",
                       "out of range"}))
    return "Invalid input";
  return "Operation failed";
}

std::string sanitize_error(const std::string &raw,
                           const SanitizeOptions &options) {
  if (trim(raw).empty())
    return "An error occurred";

  log_event(LogLevel::debug, "bridge", "error_unredacted",
            {{"text", jsonlite::Value{raw}}});

  const bool had_marker = has_sensitive_marker(raw) ||
                          std::regex_search(raw, unix_path_re()) ||
                          std::regex_search(raw, windows_path_re());

  std::string out = redact(raw);
  if (out.find("Traceback") != std::string::npos ||
      out.find("File \"") != std::string::npos)
    out = last_nonempty_line(out);

  if (has_sensitive_marker(out) || (options.strict && had_marker) ||
      (had_marker && std::regex_search(out, glued_path_re())))
    out = categorize_error(out);

  out = trim(out);
  if (out.empty())
    out = "Operation failed";
  return truncate_utf8(out, options.max_chars);
}

std::string sanitize_stream_text(const std::string &raw, std::size_t max_chars) {
  if (raw.empty())
    return raw;
  return truncate_utf8(redact(raw), max_chars);
}

} // namespace fontbridge
