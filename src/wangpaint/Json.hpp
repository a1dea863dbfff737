#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace wangpaint {

// Small in-core JSON value + parser + writer for terrain sets, grids and
// paint configs.
//
// Strict JSON: no comments, no trailing commas. Numbers are doubles. Object
// members keep their file order.
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

  static JsonValue MakeNull();
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

  // Object/array builders. No-ops on the wrong type.
  void add(std::string key, JsonValue v);
  void push(JsonValue v);
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

// On failure outError reads "JSON parse error at line L, column C: ...".
bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Escape for use inside a JSON string literal (no surrounding quotes).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
  // Arrays whose elements are all scalars go on one line (grids, colors).
  bool inlineScalarArrays = true;
};

// Serialize a value. Non-finite numbers are written as null.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

// Whole-file helpers shared by the loaders.
bool ReadFileText(const std::string& path, std::string& out, std::string& outError);
bool WriteFileText(const std::string& path, const std::string& text, std::string& outError);

bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

} // namespace wangpaint
