/*
================================================================================
Fragment 4.2 — IO: Streaming JSON Writer (Implementation)
FILE: cpp/engine/io/json_writer.cpp
================================================================================
*/

#include "engine/io/json_writer.hpp"

#include <cmath>
#include <cstdio>
#include <ostream>

namespace cropwatch::io {

std::string escape_json(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          static const char* hex = "0123456789abcdef";
          out += "\\u00";
          out += hex[(c >> 4) & 0xF];
          out += hex[c & 0xF];
        } else {
          out += static_cast<char>(c);
        }
        break;
    }
  }
  return out;
}

JsonWriter::JsonWriter(std::ostream& os, const JsonWriteOptions& opt) : os_(os), opt_(opt) {}

void JsonWriter::newline_indent() {
  if (!opt_.pretty) return;
  os_ << '\n';
  const std::size_t n = scopes_.size() * static_cast<std::size_t>(opt_.indent_spaces);
  for (std::size_t i = 0; i < n; ++i) os_ << ' ';
}

void JsonWriter::before_value() {
  if (pending_key_) {
    pending_key_ = false;
    return;
  }
  if (scopes_.empty()) return;
  // Array element.
  if (!empty_.back()) os_ << ',';
  empty_.back() = false;
  newline_indent();
}

void JsonWriter::open(Scope s, char ch) {
  before_value();
  os_ << ch;
  scopes_.push_back(s);
  empty_.push_back(true);
}

void JsonWriter::close(char ch) {
  if (scopes_.empty()) return;
  const bool was_empty = empty_.back();
  scopes_.pop_back();
  empty_.pop_back();
  if (!was_empty) newline_indent();
  os_ << ch;
  pending_key_ = false;
}

void JsonWriter::begin_object() { open(Scope::kObject, '{'); }
void JsonWriter::end_object() { close('}'); }
void JsonWriter::begin_array() { open(Scope::kArray, '['); }
void JsonWriter::end_array() { close(']'); }

void JsonWriter::key(std::string_view k) {
  if (!empty_.empty()) {
    if (!empty_.back()) os_ << ',';
    empty_.back() = false;
  }
  newline_indent();
  os_ << '"' << escape_json(k) << "\":";
  if (opt_.pretty) os_ << ' ';
  pending_key_ = true;
}

void JsonWriter::string(std::string_view v) {
  before_value();
  os_ << '"' << escape_json(v) << '"';
}

void JsonWriter::boolean(bool v) {
  before_value();
  os_ << (v ? "true" : "false");
}

void JsonWriter::null_value() {
  before_value();
  os_ << "null";
}

void JsonWriter::integer(long long v) {
  before_value();
  os_ << v;
}

void JsonWriter::number(double v) {
  if (!std::isfinite(v)) {
    null_value();
    return;
  }
  before_value();
  // %.15g: enough digits for stable output, no locale grouping.
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.15g", v);
  os_ << buf;
}

}  // namespace cropwatch::io
