#pragma once
/*
================================================================================
Fragment 4.1 — IO: Strict JSON Reader
FILE: cpp/engine/io/json_value.hpp

Purpose:
  - Small RFC 8259 reader producing a JsonValue tree for the config loader.
  - Rejects NaN/Inf literals, trailing characters, unescaped control chars.
  - Errors carry byte offset + 1-based line/col.
================================================================================
*/

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace cropwatch::io {

enum class JsonType { kNull, kBool, kNum, kStr, kObj, kArr };

const char* json_type_name(JsonType t) noexcept;

struct JsonValue {
  JsonType type = JsonType::kNull;
  bool b = false;
  double num = 0.0;
  std::string str;
  std::map<std::string, JsonValue> obj;  // sorted keys, last duplicate wins
  std::vector<JsonValue> arr;

  bool is_null() const noexcept { return type == JsonType::kNull; }
  bool is_object() const noexcept { return type == JsonType::kObj; }

  // nullptr when not an object or key absent.
  const JsonValue* find(std::string_view key) const;
};

struct JsonParseError {
  std::string message;
  std::size_t offset = 0;  // byte offset in input
  int line = 1;            // 1-based
  int col = 1;             // 1-based
};

bool parse_json(std::string_view json, JsonValue* out, JsonParseError* err = nullptr);

// Stream convenience (reads full stream into memory).
bool parse_json(std::istream& is, JsonValue* out, JsonParseError* err = nullptr);

}  // namespace cropwatch::io
