#pragma once

// asteria/jsonlite.hpp — Strict, dependency-free JSON reader for governance
// documents.
//
// STRICTNESS:
//   - Duplicate keys are rejected (json_duplicate_key), never last-wins.
//   - Trailing data after the top-level value is rejected.
//   - NaN/Infinity literals, leading zeros and raw control characters inside
//     strings are rejected.
//   - \uXXXX escapes (including surrogate pairs) decode to UTF-8.
//
// NUMBERS:
//   Non-negative integers without fraction or exponent are kept as uint64,
//   negative integers as int64, everything else (including integers too wide
//   for 64 bits) as double. The typed getters
//   below never coerce a double into an integer.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace asteria::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, std::uint64_t, double,
               std::string, Array, Object>
      v;
};

struct JsonError {
  std::string code;     // json_parse_error | json_duplicate_key
  std::string message;
};

// Parse a document whose top level must be an object. On failure *error is
// set and an empty object is returned.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Lookup without conversion. nullptr when the key is absent.
const Value* find(const Object& obj, const std::string& key);

bool is_number(const Value& v);
// Numeric view of any number alternative. Caller checks is_number() first.
double as_double(const Value& v);
std::optional<std::int64_t> as_int64(const Value& v);

// Lenient extractors: return def on absent or mistyped keys.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");

std::string escape(const std::string& s);
std::string format_double(double d);

}  // namespace asteria::jsonlite
