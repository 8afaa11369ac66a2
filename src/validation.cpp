#include "fontbridge/validation.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

#include "fontbridge/types.hpp"

namespace fs = std::filesystem;

namespace fontbridge {

namespace rules {

const std::vector<std::string> &export_formats() {
  static const std::vector<std::string> v = {"otf", "ttf", "woff", "woff2", "ufo"};
  return v;
}

const std::vector<std::string> &export_extensions() {
  static const std::vector<std::string> v = {".otf", ".ttf", ".woff", ".woff2",
                                             ".ufo"};
  return v;
}

} // namespace rules

namespace {

const char *type_name(const jsonlite::Value &v) {
  if (v.is_null()) return "null";
  if (v.is_bool()) return "boolean";
  if (v.is_number()) return "number";
  if (v.is_string()) return "string";
  if (v.is_array()) return "array";
  return "object";
}

std::string to_lower(std::string s) {
  for (auto &c : s)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// ---------------------------------------------------------------------------
// Literal encoding
// ---------------------------------------------------------------------------

void append_hex(std::string &out, char prefix, uint32_t value, int digits) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "\\%c%0*x", prefix, digits,
                static_cast<unsigned>(value));
  out += buf;
}

void encode_string(const std::string &s, std::string &out) {
  std::u32string cps;
  if (!utf8_decode(s, &cps))
    throw ValidationError("literal", "string is not valid UTF-8");
  out.push_back('"');
  for (char32_t cp : cps) {
    switch (cp) {
      case U'\\': out += "\\\\"; continue;
      case U'"': out += "\\\""; continue;
      case U'\n': out += "\\n"; continue;
      case U'\r': out += "\\r"; continue;
      case U'\t': out += "\\t"; continue;
      default: break;
    }
    if (cp < 0x20 || (cp >= 0x7f && cp <= 0xff))
      append_hex(out, 'x', cp, 2);
    else if (cp < 0x7f)
      out.push_back(static_cast<char>(cp));
    else if (cp <= 0xffff)
      append_hex(out, 'u', cp, 4);
    else
      append_hex(out, 'U', cp, 8);
  }
  out.push_back('"');
}

void encode_value(const jsonlite::Value &v, std::string &out, int depth) {
  if (depth > 64)
    throw ValidationError("literal", "value nested too deeply");
  if (v.is_null()) {
    out += "None";
  } else if (v.is_bool()) {
    out += std::get<bool>(v.v) ? "True" : "False";
  } else if (std::holds_alternative<std::uint64_t>(v.v)) {
    out += std::to_string(std::get<std::uint64_t>(v.v));
  } else if (std::holds_alternative<std::int64_t>(v.v)) {
    out += std::to_string(std::get<std::int64_t>(v.v));
  } else if (std::holds_alternative<double>(v.v)) {
    const double d = std::get<double>(v.v);
    if (!std::isfinite(d))
      throw ValidationError("literal", "number is not finite");
    out += jsonlite::format_double(d);
  } else if (v.is_string()) {
    encode_string(std::get<std::string>(v.v), out);
  } else if (v.is_array()) {
    out.push_back('[');
    bool first = true;
    for (const auto &e : std::get<jsonlite::Array>(v.v)) {
      if (!first)
        out += ", ";
      first = false;
      encode_value(e, out, depth + 1);
    }
    out.push_back(']');
  } else {
    out.push_back('{');
    bool first = true;
    for (const auto &[k, e] : std::get<jsonlite::Object>(v.v)) {
      if (!first)
        out += ", ";
      first = false;
      encode_string(k, out);
      out += ": ";
      encode_value(e, out, depth + 1);
    }
    out.push_back('}');
  }
}

// ---------------------------------------------------------------------------
// Literal decoding
// ---------------------------------------------------------------------------

void append_utf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

struct LiteralParser {
  const std::string &s;
  std::size_t i{0};

  [[noreturn]] void fail(const std::string &why) const {
    throw ValidationError("literal", why + " at offset " + std::to_string(i));
  }

  bool consume(const char *word) {
    const std::size_t n = std::char_traits<char>::length(word);
    if (s.compare(i, n, word) == 0) {
      i += n;
      return true;
    }
    return false;
  }

  void expect_sep(const char *sep) {
    if (!consume(sep))
      fail(std::string("expected '") + sep + "'");
  }

  uint32_t read_hex(int digits) {
    if (i + static_cast<std::size_t>(digits) > s.size())
      fail("truncated escape");
    uint32_t v = 0;
    for (int k = 0; k < digits; ++k) {
      const char c = s[i++];
      v <<= 4;
      if (c >= '0' && c <= '9') v |= static_cast<uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') v |= static_cast<uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') v |= static_cast<uint32_t>(c - 'A' + 10);
      else fail("bad hex digit");
    }
    return v;
  }

  std::string parse_string() {
    if (i >= s.size() || s[i] != '"')
      fail("expected string");
    ++i;
    std::string out;
    while (true) {
      if (i >= s.size())
        fail("unterminated string");
      const char c = s[i++];
      if (c == '"')
        break;
      if (static_cast<unsigned char>(c) < 0x20 || static_cast<unsigned char>(c) >= 0x7f)
        fail("raw non-printable character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i >= s.size())
        fail("unterminated escape");
      const char e = s[i++];
      uint32_t cp = 0;
      switch (e) {
        case '\\': out.push_back('\\'); continue;
        case '"': out.push_back('"'); continue;
        case 'n': out.push_back('\n'); continue;
        case 'r': out.push_back('\r'); continue;
        case 't': out.push_back('\t'); continue;
        case 'x': cp = read_hex(2); break;
        case 'u': cp = read_hex(4); break;
        case 'U': cp = read_hex(8); break;
        default: fail("unknown escape");
      }
      if (cp > rules::kCodepointMax || (cp >= 0xD800 && cp <= 0xDFFF))
        fail("escape is not a scalar value");
      append_utf8(out, cp);
    }
    return out;
  }

  jsonlite::Value parse_number() {
    const std::size_t start = i;
    if (s[i] == '-')
      ++i;
    bool is_float = false;
    while (i < s.size()) {
      const char c = s[i];
      if (std::isdigit(static_cast<unsigned char>(c))) {
        ++i;
      } else if (c == '.' || c == 'e' || c == 'E' ||
                 ((c == '+' || c == '-') && (s[i - 1] == 'e' || s[i - 1] == 'E'))) {
        is_float = true;
        ++i;
      } else {
        break;
      }
    }
    const std::string num = s.substr(start, i - start);
    if (num.empty() || num == "-")
      fail("bad number");
    errno = 0;
    char *end = nullptr;
    if (is_float) {
      const double d = std::strtod(num.c_str(), &end);
      if (*end != '\0' || errno == ERANGE || !std::isfinite(d))
        fail("bad float");
      return jsonlite::Value{d};
    }
    if (num[0] == '-') {
      const long long v = std::strtoll(num.c_str(), &end, 10);
      if (*end != '\0' || errno == ERANGE)
        fail("bad integer");
      return jsonlite::Value{static_cast<std::int64_t>(v)};
    }
    const unsigned long long v = std::strtoull(num.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE)
      fail("bad integer");
    return jsonlite::Value{static_cast<std::uint64_t>(v)};
  }

  jsonlite::Value parse_value(int depth) {
    if (depth > 64)
      fail("nested too deeply");
    if (i >= s.size())
      fail("unexpected end");
    if (consume("None")) return jsonlite::Value{nullptr};
    if (consume("True")) return jsonlite::Value{true};
    if (consume("False")) return jsonlite::Value{false};
    const char c = s[i];
    if (c == '"')
      return jsonlite::Value{parse_string()};
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parse_number();
    if (c == '[') {
      ++i;
      jsonlite::Array arr;
      if (consume("]"))
        return jsonlite::Value{std::move(arr)};
      while (true) {
        arr.push_back(parse_value(depth + 1));
        if (consume("]"))
          break;
        expect_sep(", ");
      }
      return jsonlite::Value{std::move(arr)};
    }
    if (c == '{') {
      ++i;
      jsonlite::Object obj;
      if (consume("}"))
        return jsonlite::Value{std::move(obj)};
      while (true) {
        std::string key = parse_string();
        expect_sep(": ");
        if (obj.contains(key))
          fail("duplicate key");
        obj.emplace(std::move(key), parse_value(depth + 1));
        if (consume("}"))
          break;
        expect_sep(", ");
      }
      return jsonlite::Value{std::move(obj)};
    }
    fail("unexpected character");
  }
};

} // namespace

// ---------------------------------------------------------------------------
// UTF-8
// ---------------------------------------------------------------------------

bool utf8_decode(const std::string &in, std::u32string *out) {
  std::size_t i = 0;
  while (i < in.size()) {
    const unsigned char c = static_cast<unsigned char>(in[i]);
    uint32_t cp = 0;
    std::size_t extra = 0;
    uint32_t min = 0;
    if (c < 0x80) {
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      cp = c & 0x1F; extra = 1; min = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      cp = c & 0x0F; extra = 2; min = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      cp = c & 0x07; extra = 3; min = 0x10000;
    } else {
      return false;
    }
    if (i + extra >= in.size())
      return false;
    for (std::size_t k = 1; k <= extra; ++k) {
      const unsigned char cc = static_cast<unsigned char>(in[i + k]);
      if ((cc & 0xC0) != 0x80)
        return false;
      cp = (cp << 6) | (cc & 0x3F);
    }
    if (extra > 0 && cp < min)
      return false;
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      return false;
    if (out)
      out->push_back(static_cast<char32_t>(cp));
    i += extra + 1;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Literals
// ---------------------------------------------------------------------------

ScriptLiteral encode_literal(const jsonlite::Value &value) {
  std::string out;
  encode_value(value, out, 0);
  return ScriptLiteral(std::move(out));
}

jsonlite::Value decode_literal(const std::string &text) {
  LiteralParser p{text};
  jsonlite::Value v = p.parse_value(0);
  if (p.i != text.size())
    p.fail("trailing data");
  return v;
}

// ---------------------------------------------------------------------------
// Validators
// ---------------------------------------------------------------------------

std::string validate_identifier_string(const jsonlite::Value &value,
                                       const std::string &field,
                                       std::size_t max_len) {
  if (!value.is_string())
    throw ValidationError(field, std::string("must be a string, got ") +
                                     type_name(value));
  const auto &s = std::get<std::string>(value.v);
  if (s.empty())
    throw ValidationError(field, "must be a non-empty string");
  if (s.size() > max_len)
    throw ValidationError(field, "too long (max " + std::to_string(max_len) +
                                     " characters)");
  if (s.find_first_of(std::string("\n\r\0", 3)) != std::string::npos)
    throw ValidationError(field, "contains invalid control characters");
  return s;
}

double validate_numeric_range(const jsonlite::Value &value,
                              const std::string &field, double min, double max) {
  const auto d = value.as_double();
  if (!d)
    throw ValidationError(field, std::string("must be a number, got ") +
                                     type_name(value));
  if (!std::isfinite(*d))
    throw ValidationError(field, "must be a finite number");
  if (*d < min)
    throw ValidationError(field, "must be >= " + jsonlite::format_double(min));
  if (*d > max)
    throw ValidationError(field, "must be <= " + jsonlite::format_double(max));
  return *d;
}

uint32_t validate_unicode_codepoint(const jsonlite::Value &value,
                                    const std::string &field) {
  if (std::holds_alternative<std::int64_t>(value.v))
    throw ValidationError(field, "code point must be in 0..0x10FFFF");
  if (!std::holds_alternative<std::uint64_t>(value.v))
    throw ValidationError(field, "code point must be an integer");
  const uint64_t cp = std::get<std::uint64_t>(value.v);
  if (cp > rules::kCodepointMax)
    throw ValidationError(field, "code point must be in 0..0x10FFFF");
  if (cp >= 0xD800 && cp <= 0xDFFF)
    throw ValidationError(field, "code point is in the surrogate range");
  return static_cast<uint32_t>(cp);
}

std::string validate_string_length(const jsonlite::Value &value,
                                   const std::string &field,
                                   std::size_t max_len) {
  if (!value.is_string())
    throw ValidationError(field, std::string("must be a string, got ") +
                                     type_name(value));
  const auto &s = std::get<std::string>(value.v);
  std::u32string cps;
  if (!utf8_decode(s, &cps))
    throw ValidationError(field, "is not valid UTF-8");
  if (cps.size() > max_len)
    throw ValidationError(field, "too long (max " + std::to_string(max_len) +
                                     " characters, got " +
                                     std::to_string(cps.size()) + ")");
  return s;
}

std::string validate_choice(const jsonlite::Value &value, const std::string &field,
                            const std::vector<std::string> &choices) {
  if (!value.is_string())
    throw ValidationError(field, std::string("must be a string, got ") +
                                     type_name(value));
  const auto &s = std::get<std::string>(value.v);
  if (std::find(choices.begin(), choices.end(), s) == choices.end()) {
    std::string allowed;
    for (const auto &c : choices)
      allowed += (allowed.empty() ? "" : ", ") + c;
    throw ValidationError(field, "must be one of: " + allowed);
  }
  return s;
}

std::string validate_export_path(const jsonlite::Value &value,
                                 const std::vector<std::string> &allowed_extensions) {
  const std::string field = "path";
  if (!value.is_string() || std::get<std::string>(value.v).empty())
    throw ValidationError(field, "must be a non-empty string");
  const std::string raw = std::get<std::string>(value.v);
  if (raw.find('\0') != std::string::npos)
    throw ValidationError(field, "contains invalid control characters");

  // Traversal check on the literal input, before anything is resolved.
  for (const auto &part : fs::path(raw))
    if (part.string() == "..")
      throw ValidationError(field, "path traversal detected (..) in path");

  std::string expanded = raw;
  if (raw == "~" || raw.rfind("~/", 0) == 0) {
    const char *home = std::getenv("HOME");
    if (!home || !home[0])
      throw ValidationError(field, "cannot expand '~' without HOME");
    expanded = std::string(home) + raw.substr(1);
  }

  std::error_code ec;
  fs::path abs = fs::path(expanded);
  if (abs.is_relative()) {
    const fs::path cwd = fs::current_path(ec);
    if (ec)
      throw ValidationError(field, "cannot resolve relative path");
    abs = cwd / abs;
  }
  abs = abs.lexically_normal();
  if (!abs.has_filename())
    abs = abs.parent_path();

  const std::string ext = to_lower(abs.extension().string());
  if (std::find(allowed_extensions.begin(), allowed_extensions.end(), ext) ==
      allowed_extensions.end()) {
    std::string allowed;
    for (const auto &e : allowed_extensions)
      allowed += (allowed.empty() ? "" : ", ") + e;
    throw ValidationError(field, "invalid file extension '" +
                                     abs.extension().string() +
                                     "'. Allowed: " + allowed);
  }

  const fs::path parent = abs.parent_path();
  if (!fs::is_directory(parent, ec))
    throw ValidationError(field, "parent directory does not exist");

  for (fs::path p = abs; !p.empty(); p = p.parent_path()) {
    if (fs::is_symlink(fs::symlink_status(p, ec)))
      throw ValidationError(field, "path or one of its parent directories is a "
                                   "symbolic link");
    if (p == p.root_path())
      break;
  }
  return abs.string();
}

std::size_t validate_request_size(const jsonlite::Value &payload,
                                  std::size_t max_bytes) {
  const std::size_t n = jsonlite::to_json(payload).size();
  if (n > max_bytes)
    throw RequestSizeError(n, max_bytes);
  return n;
}

} // namespace fontbridge
