#pragma once

// fontbridge/sanitize.hpp — Redaction of host error text before it leaves the
// server.
//
// Every failure message returned to a caller goes through sanitize_error().
// The unredacted input is written to the diagnostic log (debug, "bridge"
// channel) and nowhere else.

#include <cstddef>
#include <string>

namespace fontbridge {

struct SanitizeOptions {
  std::size_t max_chars{300};
  // Replace any text that carried a sensitive marker with a generic category
  // message, even when redaction alone would have removed the marker.
  bool strict{false};
};

// Redacts paths and line locators, collapses tracebacks to their last line,
// falls back to a generic category message when sensitive markers survive or
// a redacted path is still joined to surrounding text, and truncates to
// max_chars bytes on a UTF-8 boundary.
std::string sanitize_error(const std::string &raw,
                           const SanitizeOptions &options = {});

// Path and line redaction only, for fallback stdout/stderr. Does not collapse
// or categorize.
std::string sanitize_stream_text(const std::string &raw,
                                 std::size_t max_chars = 4096);

// One of "Permission denied", "Resource not found", "Invalid input",
// "Operation timed out", "Operation failed", by keyword.
std::string categorize_error(const std::string &text);

// True when text contains a home-directory, temp-directory or traceback marker.
bool has_sensitive_marker(const std::string &text);

} // namespace fontbridge
