#include "asteria/jsonlite.hpp"

// Notes on jsonlite:
//
// Documents read here are small (manifests, constants, one ledger line), so
// the reader is a plain recursive descent over the whole text. Nesting is
// bounded by kMaxDepth.
//
// LOCALE:
//   std::strtod() is locale-sensitive. The process never calls setlocale(),
//   so the "C" locale applies.

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

namespace asteria::jsonlite {

namespace {

constexpr int kMaxDepth = 64;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

void append_utf8(std::string& out, std::uint32_t cp) {
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

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text) {}

  Value document() {
    Value v = value(0);
    skip_ws();
    if (!err_ && pos_ != s_.size()) fail("trailing data at offset " + std::to_string(pos_));
    return v;
  }

  const std::optional<JsonError>& error() const { return err_; }

 private:
  void fail(std::string message, const char* code = "json_parse_error") {
    if (!err_) err_ = JsonError{code, std::move(message)};
  }

  void skip_ws() {
    while (pos_ < s_.size() &&
           (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\n' || s_[pos_] == '\r')) {
      ++pos_;
    }
  }

  bool consume(char c) {
    skip_ws();
    if (pos_ < s_.size() && s_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  bool literal(const char* word) {
    const std::string w(word);
    if (s_.compare(pos_, w.size(), w) != 0) return false;
    pos_ += w.size();
    return true;
  }

  Value value(int depth) {
    if (depth > kMaxDepth) {
      fail("nesting deeper than " + std::to_string(kMaxDepth));
      return {};
    }
    skip_ws();
    if (pos_ >= s_.size()) {
      fail("unexpected end of input");
      return {};
    }
    const char c = s_[pos_];
    if (c == '{') return Value{object(depth)};
    if (c == '[') return Value{array(depth)};
    if (c == '"') return Value{string()};
    if (literal("true")) return Value{true};
    if (literal("false")) return Value{false};
    if (literal("null")) return Value{nullptr};
    if (c == '-' || is_digit(c)) return number();
    fail("unexpected token at offset " + std::to_string(pos_));
    return {};
  }

  bool hex4(std::uint32_t* out) {
    if (pos_ + 4 > s_.size()) return false;
    std::uint32_t v = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s_[pos_++];
      v <<= 4;
      if (h >= '0' && h <= '9') v |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') v |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') v |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return false;
    }
    *out = v;
    return true;
  }

  std::string string() {
    std::string out;
    if (!consume('"')) {
      fail("expected string at offset " + std::to_string(pos_));
      return out;
    }
    while (pos_ < s_.size()) {
      const char c = s_[pos_++];
      if (c == '"') return out;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("control character in string at offset " + std::to_string(pos_ - 1));
        return out;
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= s_.size()) break;
      const char e = s_[pos_++];
      switch (e) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          std::uint32_t cp = 0;
          if (!hex4(&cp)) {
            fail("invalid \\u escape");
            return out;
          }
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            std::uint32_t lo = 0;
            if (!literal("\\u") || !hex4(&lo) || lo < 0xDC00 || lo > 0xDFFF) {
              fail("unpaired surrogate in \\u escape");
              return out;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired surrogate in \\u escape");
            return out;
          }
          append_utf8(out, cp);
          break;
        }
        default:
          fail(std::string("invalid escape \\") + e);
          return out;
      }
    }
    fail("unterminated string");
    return out;
  }

  // RFC 8259 grammar: -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  Value number() {
    const size_t start = pos_;
    const bool negative = s_[pos_] == '-';
    if (negative) ++pos_;
    if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
      fail("invalid number at offset " + std::to_string(start));
      return {};
    }
    if (s_[pos_] == '0' && pos_ + 1 < s_.size() && is_digit(s_[pos_ + 1])) {
      fail("leading zero in number at offset " + std::to_string(start));
      return {};
    }
    while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;

    bool integral = true;
    if (pos_ < s_.size() && s_[pos_] == '.') {
      integral = false;
      ++pos_;
      if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
        fail("digit expected after '.' at offset " + std::to_string(pos_));
        return {};
      }
      while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    }
    if (pos_ < s_.size() && (s_[pos_] == 'e' || s_[pos_] == 'E')) {
      integral = false;
      ++pos_;
      if (pos_ < s_.size() && (s_[pos_] == '+' || s_[pos_] == '-')) ++pos_;
      if (pos_ >= s_.size() || !is_digit(s_[pos_])) {
        fail("digit expected in exponent at offset " + std::to_string(pos_));
        return {};
      }
      while (pos_ < s_.size() && is_digit(s_[pos_])) ++pos_;
    }

    const std::string text = s_.substr(start, pos_ - start);
    errno = 0;
    if (integral && negative) {
      const long long v = std::strtoll(text.c_str(), nullptr, 10);
      if (errno != ERANGE) return Value{static_cast<std::int64_t>(v)};
    } else if (integral) {
      const unsigned long long v = std::strtoull(text.c_str(), nullptr, 10);
      if (errno != ERANGE) return Value{static_cast<std::uint64_t>(v)};
    }
    // Fractions, exponents and integers too wide for 64 bits.
    errno = 0;
    const double v = std::strtod(text.c_str(), nullptr);
    if (errno != ERANGE && std::isfinite(v)) return Value{v};
    fail("number out of range: " + text);
    return {};
  }

  Object object(int depth) {
    Object out;
    consume('{');
    if (consume('}')) return out;
    while (!err_) {
      skip_ws();
      std::string key = string();
      if (err_) break;
      if (out.contains(key)) {
        fail("duplicate key: " + key, "json_duplicate_key");
        break;
      }
      if (!consume(':')) {
        fail("expected ':' after key " + key);
        break;
      }
      Value v = value(depth + 1);
      if (err_) break;
      out.emplace(std::move(key), std::move(v));
      if (consume('}')) break;
      if (!consume(',')) fail("expected ',' or '}' at offset " + std::to_string(pos_));
    }
    return out;
  }

  Array array(int depth) {
    Array out;
    consume('[');
    if (consume(']')) return out;
    while (!err_) {
      out.push_back(value(depth + 1));
      if (err_) break;
      if (consume(']')) break;
      if (!consume(',')) fail("expected ',' or ']' at offset " + std::to_string(pos_));
    }
    return out;
  }

  const std::string& s_;
  size_t pos_{0};
  std::optional<JsonError> err_;
};

}  // namespace

std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (unsigned char c : s) {
    switch (c) {
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          o += buf;
        } else {
          o += static_cast<char>(c);
        }
    }
  }
  return o;
}

// Shortest of %.15g / %.16g / %.17g that reads back to the same double, so
// reports never round a value away. Integral values keep a ".0" suffix.
std::string format_double(double d) {
  if (!std::isfinite(d)) return "null";
  if (d == 0.0) return "0.0";
  char buf[40];
  for (int precision = 15; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    if (std::strtod(buf, nullptr) == d) break;
  }
  std::string result(buf);
  if (result.find_first_of(".e") == std::string::npos) result += ".0";
  return result;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  Reader r(text);
  Value v = r.document();
  std::optional<JsonError> err = r.error();
  if (!err && !std::holds_alternative<Object>(v.v)) {
    err = JsonError{"json_parse_error", "top-level value must be an object"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::move(std::get<Object>(v.v));
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

bool is_number(const Value& v) {
  return std::holds_alternative<double>(v.v) ||
         std::holds_alternative<std::uint64_t>(v.v) ||
         std::holds_alternative<std::int64_t>(v.v);
}

double as_double(const Value& v) {
  if (const auto* d = std::get_if<double>(&v.v)) return *d;
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) return static_cast<double>(*u);
  if (const auto* i = std::get_if<std::int64_t>(&v.v)) return static_cast<double>(*i);
  return 0.0;
}

std::optional<std::int64_t> as_int64(const Value& v) {
  if (const auto* i = std::get_if<std::int64_t>(&v.v)) return *i;
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(*u);
  }
  return std::nullopt;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const Value* v = find(obj, key);
  if (!v) return def;
  const auto* s = std::get_if<std::string>(&v->v);
  return s ? *s : def;
}

}  // namespace asteria::jsonlite
