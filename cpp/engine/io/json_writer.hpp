#pragma once
/*
================================================================================
Fragment 4.2 — IO: Streaming JSON Writer
FILE: cpp/engine/io/json_writer.hpp

  - Stable key order is the caller's order (deterministic diffs).
  - JSON cannot represent NaN/Inf: unset numbers are written as null.
================================================================================
*/

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace cropwatch::io {

struct JsonWriteOptions {
  bool pretty = true;
  int indent_spaces = 2;
};

std::string escape_json(std::string_view s);

class JsonWriter {
 public:
  JsonWriter(std::ostream& os, const JsonWriteOptions& opt = {});

  void begin_object();
  void end_object();
  void begin_array();
  void end_array();

  void key(std::string_view k);

  void string(std::string_view v);
  void boolean(bool v);
  void null_value();
  void integer(long long v);
  void number(double v);          // non-finite -> null

  // key + value shorthands
  void field(std::string_view k, std::string_view v) { key(k); string(v); }
  void field(std::string_view k, const char* v) { key(k); string(v); }
  void field(std::string_view k, bool v) { key(k); boolean(v); }
  void field(std::string_view k, int v) { key(k); integer(v); }
  void field(std::string_view k, double v) { key(k); number(v); }

 private:
  enum class Scope { kObject, kArray };

  void before_value();
  void newline_indent();
  void open(Scope s, char ch);
  void close(char ch);

  std::ostream& os_;
  JsonWriteOptions opt_;
  std::vector<Scope> scopes_;
  std::vector<bool> empty_;
  bool pending_key_ = false;
};

}  // namespace cropwatch::io
