#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace parcelcity {

// Minimal JSON document model used for city configuration files.
//
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are stored as double.
//  - Objects keep their members in file order (duplicate keys: first wins on lookup).
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull() { return JsonValue{}; }
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Appends a member to an object value (no-op for other types).
  void set(std::string key, JsonValue v);
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

// Parse a complete document. On failure outError reads
// "JSON parse error at <line>:<col>: <reason>".
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
};

// Returns false on non-finite numbers or stream failure.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt = {});

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

} // namespace parcelcity
