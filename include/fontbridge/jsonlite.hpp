#pragma once

// fontbridge/jsonlite.hpp — Minimal JSON value model, strict parser and serializer.
//
// Used for every JSON surface in the server: RPC frames, tool arguments, the
// host's output file, configuration files and the event log.
//
// INVARIANTS:
//   - parse() rejects duplicate keys, trailing data, NaN/Infinity and
//     unterminated strings. Errors are reported through JsonError, never thrown.
//   - Integers are stored canonically: non-negative values as uint64_t,
//     negative values as int64_t. A Value built from any integral type follows
//     the same rule, so parse(to_json(v)) == v for every finite value.
//   - to_json() output is ASCII-safe for control characters (\uXXXX) and has
//     sorted object keys (std::map iteration).

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace fontbridge::jsonlite {

struct Value;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, std::uint64_t, double,
               std::string, Array, Object>
      v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                 std::is_signed_v<T>,
                             int> = 0>
  Value(T i) {
    if (i < 0)
      v = static_cast<std::int64_t>(i);
    else
      v = static_cast<std::uint64_t>(i);
  }
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                                 std::is_unsigned_v<T>,
                             int> = 0>
  Value(T u) : v(static_cast<std::uint64_t>(u)) {}
  Value(double d) : v(d) {}
  Value(const char *s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_bool() const { return std::holds_alternative<bool>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_integer() const {
    return std::holds_alternative<std::int64_t>(v) ||
           std::holds_alternative<std::uint64_t>(v);
  }
  bool is_number() const {
    return is_integer() || std::holds_alternative<double>(v);
  }

  // Numeric view of any number alternative; nullopt for non-numbers.
  std::optional<double> as_double() const;
};

bool operator==(const Value &a, const Value &b);
inline bool operator!=(const Value &a, const Value &b) { return !(a == b); }

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. On failure returns null and sets *error.
Value parse_value(const std::string &text, std::optional<JsonError> *error);

// Parse a JSON document whose root must be an object. Non-object roots set
// *error to json_not_object and return an empty object.
Object parse(const std::string &text, std::optional<JsonError> *error);

// Compact serialization with sorted keys.
std::string to_json(const Value &v);

// Two-space indented serialization, for human-facing RPC text content.
std::string to_json_pretty(const Value &v);

// Deterministic double formatting shared by to_json() and the event log.
std::string format_double(double d);

// Type-safe extractors. Missing keys and type mismatches return def.
std::string get_string(const Object &obj, const std::string &key,
                       const std::string &def = "");
bool get_bool(const Object &obj, const std::string &key, bool def = false);
unsigned long long get_u64(const Object &obj, const std::string &key,
                           unsigned long long def = 0);
const Value *find(const Object &obj, const std::string &key);

} // namespace fontbridge::jsonlite
