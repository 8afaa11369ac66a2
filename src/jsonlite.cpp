#include "fontbridge/jsonlite.hpp"

// Notes on jsonlite:
//
// DETERMINISM:
//   - to_json() emits sorted keys (std::map iteration).
//   - format_double() uses "%.17g", which round-trips every finite IEEE 754
//     double, and always carries a '.' or exponent so the value re-parses as a
//     double rather than an integer.
//
// HARDENING:
//   - Nesting depth is capped (kMaxDepth) so adversarial input cannot exhaust
//     the stack of a request thread.
//   - Raw control characters inside strings are rejected, as RFC 8259 requires.
//   - \uXXXX escapes are decoded to UTF-8, including surrogate pairs. Lone
//     surrogates are rejected.

#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace fontbridge::jsonlite {

namespace {

constexpr std::size_t kMaxDepth = 128;

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct Parser {
  const std::string &s;
  size_t i{0};
  size_t depth{0};
  std::optional<JsonError> err;

  void ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
      ++i;
  }
  bool eat(char c) {
    ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  bool read_hex4(std::uint32_t &out) {
    if (i + 4 > s.size())
      return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9')
        out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f')
        out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F')
        out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else
        return false;
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) {
      err = JsonError{"json_parse_error", "expected string"};
      return {};
    }
    std::string o;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"')
        return o;
      if (static_cast<unsigned char>(c) < 0x20) {
        err = JsonError{"json_parse_error", "control character in string"};
        return {};
      }
      if (c != '\\') {
        o += c;
        continue;
      }
      if (i >= s.size())
        break;
      const char n = s[i++];
      switch (n) {
      case '"': o += '"'; break;
      case '\\': o += '\\'; break;
      case '/': o += '/'; break;
      case 'b': o += '\b'; break;
      case 'f': o += '\f'; break;
      case 'n': o += '\n'; break;
      case 'r': o += '\r'; break;
      case 't': o += '\t'; break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!read_hex4(cp)) {
          err = JsonError{"json_parse_error", "invalid unicode escape"};
          return {};
        }
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t lo = 0;
          if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') {
            err = JsonError{"json_parse_error", "unpaired surrogate"};
            return {};
          }
          i += 2;
          if (!read_hex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
            err = JsonError{"json_parse_error", "unpaired surrogate"};
            return {};
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          err = JsonError{"json_parse_error", "unpaired surrogate"};
          return {};
        }
        append_utf8(o, cp);
        break;
      }
      default:
        err = JsonError{"json_parse_error", "invalid escape"};
        return {};
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value &out_val) {
    ws();
    const size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 ||
        s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }

    if (i < s.size() && s[i] == '-')
      ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i])))
      return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
      ++i;

    bool is_float = false;
    if (i < s.size() && s[i] == '.') {
      is_float = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
        ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_float = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-'))
        ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])))
        ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    try {
      if (is_float) {
        out_val = Value{std::stod(num_str)};
      } else if (num_str[0] == '-') {
        out_val = Value{static_cast<std::int64_t>(std::stoll(num_str))};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num_str))};
      }
      return true;
    } catch (const std::out_of_range &) {
      // Integers beyond 64 bits degrade to double rather than failing.
      try {
        out_val = Value{std::stod(num_str)};
        return true;
      } catch (const std::exception &) {
        err = JsonError{"json_parse_error", "number out of range"};
        return false;
      }
    } catch (const std::invalid_argument &) {
      err = JsonError{"json_parse_error", "invalid number"};
      return false;
    }
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) {
      err = JsonError{"json_parse_error", "unexpected eof"};
      return {};
    }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) {
        err = JsonError{"json_parse_error", "nesting too deep"};
        return {};
      }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"')
      return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) {
      i += 4;
      return Value{true};
    }
    if (s.compare(i, 5, "false") == 0) {
      i += 5;
      return Value{false};
    }
    if (s.compare(i, 4, "null") == 0) {
      i += 4;
      return Value{nullptr};
    }
    Value num_val;
    if (parse_number(num_val))
      return num_val;
    if (!err)
      err = JsonError{"json_parse_error", "unexpected token"};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}'))
      return out;
    while (!err) {
      auto k = parse_string();
      if (err)
        break;
      if (out.contains(k)) {
        err = JsonError{"json_duplicate_key", "duplicate key: " + k};
        break;
      }
      if (!eat(':')) {
        err = JsonError{"json_parse_error", "expected :"};
        break;
      }
      out[k] = parse_value();
      if (err)
        break;
      if (eat('}'))
        break;
      if (!eat(',')) {
        err = JsonError{"json_parse_error", "expected ,"};
        break;
      }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']'))
      return out;
    while (!err) {
      out.push_back(parse_value());
      if (err)
        break;
      if (eat(']'))
        break;
      if (!eat(',')) {
        err = JsonError{"json_parse_error", "expected ,"};
        break;
      }
    }
    return out;
  }
};

// Fast path for strings with no escape characters (the common case): return
// the input unchanged.
std::string escape_inner(const std::string &s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20 || c == 0x7F) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape)
    return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (c == '"')
      o += "\\\"";
    else if (c == '\\')
      o += "\\\\";
    else if (c == '\b')
      o += "\\b";
    else if (c == '\f')
      o += "\\f";
    else if (c == '\n')
      o += "\\n";
    else if (c == '\r')
      o += "\\r";
    else if (c == '\t')
      o += "\\t";
    else if (uc < 0x20 || uc == 0x7F) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", uc);
      o += buf;
    } else
      o += c;
  }
  return o;
}

void write_json(std::ostringstream &oss, const Value &v, int indent, int level) {
  const auto newline = [&](int lvl) {
    if (indent <= 0)
      return;
    oss << '\n' << std::string(static_cast<size_t>(indent * lvl), ' ');
  };

  if (std::holds_alternative<Object>(v.v)) {
    const auto &obj = std::get<Object>(v.v);
    if (obj.empty()) {
      oss << "{}";
      return;
    }
    oss << '{';
    bool first = true;
    for (const auto &[k, vv] : obj) {
      if (!first)
        oss << ',';
      first = false;
      newline(level + 1);
      oss << '"' << escape_inner(k) << '"' << (indent > 0 ? ": " : ":");
      write_json(oss, vv, indent, level + 1);
    }
    newline(level);
    oss << '}';
    return;
  }
  if (std::holds_alternative<Array>(v.v)) {
    const auto &arr = std::get<Array>(v.v);
    if (arr.empty()) {
      oss << "[]";
      return;
    }
    oss << '[';
    bool first = true;
    for (const auto &vv : arr) {
      if (!first)
        oss << ',';
      first = false;
      newline(level + 1);
      write_json(oss, vv, indent, level + 1);
    }
    newline(level);
    oss << ']';
    return;
  }
  if (std::holds_alternative<std::nullptr_t>(v.v))
    oss << "null";
  else if (std::holds_alternative<bool>(v.v))
    oss << (std::get<bool>(v.v) ? "true" : "false");
  else if (std::holds_alternative<std::string>(v.v))
    oss << '"' << escape_inner(std::get<std::string>(v.v)) << '"';
  else if (std::holds_alternative<std::uint64_t>(v.v))
    oss << std::to_string(std::get<std::uint64_t>(v.v));
  else if (std::holds_alternative<std::int64_t>(v.v))
    oss << std::to_string(std::get<std::int64_t>(v.v));
  else
    oss << format_double(std::get<double>(v.v));
}

} // namespace

std::optional<double> Value::as_double() const {
  if (std::holds_alternative<double>(v))
    return std::get<double>(v);
  if (std::holds_alternative<std::uint64_t>(v))
    return static_cast<double>(std::get<std::uint64_t>(v));
  if (std::holds_alternative<std::int64_t>(v))
    return static_cast<double>(std::get<std::int64_t>(v));
  return std::nullopt;
}

bool operator==(const Value &a, const Value &b) { return a.v == b.v; }

std::string format_double(double d) {
  // JSON has no representation for non-finite numbers.
  if (!std::isfinite(d))
    return "null";
  char buf[64];
  const int n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf)))
    return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  if (result.find_first_of(".eE") == std::string::npos)
    result += ".0";
  return result;
}

std::string to_json(const Value &v) {
  std::ostringstream oss;
  write_json(oss, v, 0, 0);
  return oss.str();
}

std::string to_json_pretty(const Value &v) {
  std::ostringstream oss;
  write_json(oss, v, 2, 0);
  return oss.str();
}


Value parse_value(const std::string &text, std::optional<JsonError> *error) {
  Parser p{text};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size())
    p.err = JsonError{"json_parse_error", "trailing data"};
  if (error)
    *error = p.err;
  if (p.err)
    return {};
  return v;
}

Object parse(const std::string &text, std::optional<JsonError> *error) {
  std::optional<JsonError> err;
  auto v = parse_value(text, &err);
  if (!err && !v.is_object())
    err = JsonError{"json_not_object", "root is not an object"};
  if (error)
    *error = err;
  if (err)
    return {};
  return std::get<Object>(std::move(v.v));
}

const Value *find(const Object &obj, const std::string &key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const Object &obj, const std::string &key,
                       const std::string &def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v))
    return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object &obj, const std::string &key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v))
    return def;
  return std::get<bool>(it->second.v);
}

unsigned long long get_u64(const Object &obj, const std::string &key,
                           unsigned long long def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v))
    return def;
  return std::get<std::uint64_t>(it->second.v);
}

} // namespace fontbridge::jsonlite
