/*
================================================================================
Fragment 4.1 — IO: Strict JSON Reader (Implementation)
FILE: cpp/engine/io/json_value.cpp
================================================================================
*/

#include "engine/io/json_value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <istream>
#include <iterator>
#include <string>
#include <utility>

namespace cropwatch::io {

const char* json_type_name(JsonType t) noexcept {
  switch (t) {
    case JsonType::kNull: return "null";
    case JsonType::kBool: return "boolean";
    case JsonType::kNum:  return "number";
    case JsonType::kStr:  return "string";
    case JsonType::kObj:  return "object";
    case JsonType::kArr:  return "array";
    default:              return "unknown";
  }
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (type != JsonType::kObj) return nullptr;
  auto it = obj.find(std::string(key));
  return it == obj.end() ? nullptr : &it->second;
}

namespace {

constexpr int kMaxDepth = 64;

class Parser {
 public:
  Parser(std::string_view text, JsonParseError* err)
      : b_(text.data()), p_(text.data()), e_(text.data() + text.size()), err_(err) {}

  bool parse_document(JsonValue& out) {
    if (!parse_value(out, 0)) return false;
    skip_ws();
    if (!eof()) return fail("Trailing characters after JSON");
    return true;
  }

 private:
  bool eof() const noexcept { return p_ >= e_; }
  char peek() const noexcept { return *p_; }

  void advance() noexcept {
    if (*p_ == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    ++p_;
  }

  bool fail(std::string msg) {
    if (err_) {
      err_->message = std::move(msg);
      err_->offset = static_cast<std::size_t>(p_ - b_);
      err_->line = line_;
      err_->col = col_;
    }
    return false;
  }

  void skip_ws() noexcept {
    while (!eof()) {
      const char c = peek();
      if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
      advance();
    }
  }

  bool consume(char ch) {
    skip_ws();
    if (eof() || peek() != ch) return fail(std::string("Expected '") + ch + "'");
    advance();
    return true;
  }

  bool literal(const char* lit) {
    const char* q = p_;
    for (const char* s = lit; *s; ++s, ++q) {
      if (q >= e_ || *q != *s) return fail("Invalid literal");
    }
    while (p_ < q) advance();
    return true;
  }

  bool hex4(unsigned& out) {
    out = 0;
    for (int i = 0; i < 4; ++i) {
      if (eof()) return fail("Unexpected EOF in \\uXXXX escape");
      const char ch = peek();
      unsigned v = 0;
      if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
      else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
      else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
      else return fail("Invalid hex digit in \\uXXXX escape");
      out = (out << 4) | v;
      advance();
    }
    return true;
  }

  static void append_utf8(std::string& s, unsigned cp) {
    if (cp <= 0x7F) {
      s.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
      s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
      s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool unicode_escape(std::string& out) {
    unsigned u = 0;
    if (!hex4(u)) return false;
    if (u >= 0xDC00 && u <= 0xDFFF) return fail("Unexpected low surrogate");
    if (u < 0xD800 || u > 0xDBFF) {
      append_utf8(out, u);
      return true;
    }
    // High surrogate: a "\uDC00..\uDFFF" must follow.
    if (eof() || peek() != '\\') return fail("High surrogate not followed by low surrogate");
    advance();
    if (eof() || peek() != 'u') return fail("High surrogate not followed by \\u");
    advance();
    unsigned u2 = 0;
    if (!hex4(u2)) return false;
    if (u2 < 0xDC00 || u2 > 0xDFFF) return fail("Invalid low surrogate");
    append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (u2 - 0xDC00u)));
    return true;
  }

  bool parse_string(std::string& out) {
    skip_ws();
    if (eof() || peek() != '"') return fail("Expected string");
    advance();
    out.clear();

    while (!eof()) {
      const char ch = peek();
      if (ch == '"') {
        advance();
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) return fail("Unescaped control character in string");
      if (ch != '\\') {
        out.push_back(ch);
        advance();
        continue;
      }
      advance();
      if (eof()) return fail("Unexpected EOF in string escape");
      const char esc = peek();
      advance();
      switch (esc) {
        case '"':  out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/':  out.push_back('/'); break;
        case 'b':  out.push_back('\b'); break;
        case 'f':  out.push_back('\f'); break;
        case 'n':  out.push_back('\n'); break;
        case 'r':  out.push_back('\r'); break;
        case 't':  out.push_back('\t'); break;
        case 'u':
          if (!unicode_escape(out)) return false;
          break;
        default:
          return fail("Invalid escape sequence");
      }
    }
    return fail("Unterminated string");
  }

  bool digits(const char* what) {
    if (eof() || !std::isdigit(static_cast<unsigned char>(peek()))) return fail(what);
    while (!eof() && std::isdigit(static_cast<unsigned char>(peek()))) advance();
    return true;
  }

  // JSON number grammar only: no leading '+', no NaN/Inf, no leading zeros.
  bool parse_number(double& out) {
    const char* start = p_;
    if (peek() == '-') advance();
    if (eof()) return fail("Expected digits after '-'");
    if (peek() == '0') {
      advance();
    } else if (!digits("Invalid number")) {
      return false;
    }
    if (!eof() && peek() == '.') {
      advance();
      if (!digits("Expected digits after '.'")) return false;
    }
    if (!eof() && (peek() == 'e' || peek() == 'E')) {
      advance();
      if (!eof() && (peek() == '+' || peek() == '-')) advance();
      if (!digits("Expected digits in exponent")) return false;
    }

    const std::string tmp(start, p_);
    errno = 0;
    char* endptr = nullptr;
    const double v = std::strtod(tmp.c_str(), &endptr);
    if (endptr == tmp.c_str() || *endptr != '\0') return fail("Failed to parse number");
    if (errno == ERANGE || !std::isfinite(v)) return fail("Number out of range");
    out = v;
    return true;
  }

  bool parse_array(JsonValue& out, int depth) {
    if (!consume('[')) return false;
    out.type = JsonType::kArr;
    skip_ws();
    if (!eof() && peek() == ']') {
      advance();
      return true;
    }
    while (true) {
      JsonValue v;
      if (!parse_value(v, depth + 1)) return false;
      out.arr.push_back(std::move(v));
      skip_ws();
      if (eof()) return fail("Unexpected EOF in array");
      if (peek() == ',') {
        advance();
        continue;
      }
      if (peek() == ']') {
        advance();
        return true;
      }
      return fail("Expected ',' or ']'");
    }
  }

  bool parse_object(JsonValue& out, int depth) {
    if (!consume('{')) return false;
    out.type = JsonType::kObj;
    skip_ws();
    if (!eof() && peek() == '}') {
      advance();
      return true;
    }
    while (true) {
      std::string key;
      if (!parse_string(key)) return false;
      if (!consume(':')) return false;
      JsonValue v;
      if (!parse_value(v, depth + 1)) return false;
      out.obj[std::move(key)] = std::move(v);
      skip_ws();
      if (eof()) return fail("Unexpected EOF in object");
      if (peek() == ',') {
        advance();
        continue;
      }
      if (peek() == '}') {
        advance();
        return true;
      }
      return fail("Expected ',' or '}'");
    }
  }

  bool parse_value(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return fail("Nesting too deep");
    skip_ws();
    if (eof()) return fail("Unexpected EOF");

    const char ch = peek();
    if (ch == '{') return parse_object(out, depth);
    if (ch == '[') return parse_array(out, depth);
    if (ch == '"') {
      out.type = JsonType::kStr;
      return parse_string(out.str);
    }
    if (ch == 't' || ch == 'f') {
      out.type = JsonType::kBool;
      out.b = (ch == 't');
      return literal(out.b ? "true" : "false");
    }
    if (ch == 'n') {
      out.type = JsonType::kNull;
      return literal("null");
    }
    if (ch == '-' || (ch >= '0' && ch <= '9')) {
      out.type = JsonType::kNum;
      return parse_number(out.num);
    }
    return fail("Unexpected token");
  }

  const char* b_;
  const char* p_;
  const char* e_;
  JsonParseError* err_;
  int line_ = 1;
  int col_ = 1;
};

}  // namespace

bool parse_json(std::string_view json, JsonValue* out, JsonParseError* err) {
  if (!out) return false;
  JsonValue root;
  Parser parser(json, err);
  if (!parser.parse_document(root)) return false;
  *out = std::move(root);
  return true;
}

bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err) {
  const std::string buf((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
  return parse_json(std::string_view(buf), out, err);
}

}  // namespace cropwatch::io
