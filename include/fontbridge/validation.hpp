#pragma once

// fontbridge/validation.hpp — Caller-value validation and script literal encoding.
//
// Every caller-controlled value reaches script text through encode_literal().
// ScriptLiteral has no public constructor, and ScriptTemplate::render() only
// accepts ScriptLiteral bindings, so unescaped text cannot be spliced into a
// script by accident.
//
// All validators throw ValidationError{field, reason} and never touch the
// host process.

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "fontbridge/jsonlite.hpp"

namespace fontbridge {

namespace rules {
constexpr std::size_t kGlyphNameMax = 255;
constexpr double kWidthMin = 0;
constexpr double kWidthMax = 10000;
constexpr double kRotateMin = -360;
constexpr double kRotateMax = 360;
constexpr double kScaleMin = -100;
constexpr double kScaleMax = 100;
constexpr double kTranslateMin = -10000;
constexpr double kTranslateMax = 10000;
constexpr std::size_t kSearchPatternMax = 255;
constexpr std::size_t kFontInfoFieldMax = 1000;
constexpr uint32_t kCodepointMax = 0x10FFFF;
constexpr std::size_t kMaxRequestBytes = 1000000;

const std::vector<std::string> &export_formats();       // otf ttf woff woff2 ufo
const std::vector<std::string> &export_extensions();    // .otf .ttf .woff .woff2 .ufo
} // namespace rules

// ---------------------------------------------------------------------------
// ScriptLiteral — text that is a valid, fully escaped interpreter literal.
// ---------------------------------------------------------------------------
class ScriptLiteral {
public:
  const std::string &text() const { return text_; }

private:
  explicit ScriptLiteral(std::string text) : text_(std::move(text)) {}
  std::string text_;

  friend ScriptLiteral encode_literal(const jsonlite::Value &value);
};

// Encodes a value in the host interpreter's (Python) literal syntax. Output is
// pure ASCII. Throws ValidationError("literal", ...) for non-finite numbers and
// strings that are not valid UTF-8.
ScriptLiteral encode_literal(const jsonlite::Value &value);

// Inverse of encode_literal over the same grammar. Throws ValidationError on
// anything encode_literal would not have produced.
jsonlite::Value decode_literal(const std::string &text);

// ---------------------------------------------------------------------------
// Validators
// ---------------------------------------------------------------------------

// Non-empty string of at most max_len bytes with no '\n', '\r' or NUL.
std::string validate_identifier_string(const jsonlite::Value &value,
                                       const std::string &field,
                                       std::size_t max_len = rules::kGlyphNameMax);

// Finite number in [min, max] inclusive.
double validate_numeric_range(const jsonlite::Value &value,
                              const std::string &field, double min, double max);

// Integer in [0, 0x10FFFF], excluding the surrogate block.
uint32_t validate_unicode_codepoint(const jsonlite::Value &value,
                                    const std::string &field);

// Valid UTF-8 string of at most max_len code points.
std::string validate_string_length(const jsonlite::Value &value,
                                   const std::string &field,
                                   std::size_t max_len);

// String equal to one of choices.
std::string validate_choice(const jsonlite::Value &value, const std::string &field,
                            const std::vector<std::string> &choices);

// Returns the absolute, lexically normal path. Rejects '..' components before
// any resolution, extensions outside allowed_extensions (case-insensitive),
// missing parent directories, and paths whose target or any ancestor is a
// symbolic link.
std::string validate_export_path(
    const jsonlite::Value &value,
    const std::vector<std::string> &allowed_extensions = rules::export_extensions());

// Throws RequestSizeError when the serialized payload exceeds max_bytes.
// Returns the serialized size.
std::size_t validate_request_size(const jsonlite::Value &payload,
                                  std::size_t max_bytes = rules::kMaxRequestBytes);

// Decodes UTF-8 into code points. Returns false on malformed, overlong or
// surrogate encodings.
bool utf8_decode(const std::string &in, std::u32string *out);

} // namespace fontbridge
