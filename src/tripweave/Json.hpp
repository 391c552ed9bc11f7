#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace tripweave {

// JSON tree for catalogs and plan configs; results go out through JsonWriter.
//
// The parser accepts strict RFC 8259 text only. Numbers become doubles, object
// members stay in document order, and \uXXXX escapes (surrogate pairs too)
// are decoded to UTF-8.
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
};

const char* JsonTypeName(JsonValue::Type t);

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Read and parse a whole file.
bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
};

// Streaming writer. Key order is the call order. After the first misuse the
// writer keeps the error and every later call returns false.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  // Only valid directly inside an object.
  bool key(const std::string& k);

  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool stringValue(const std::string& s);

  // Convenience: key + value.
  bool field(const std::string& k, const std::string& v) { return key(k) && stringValue(v); }
  bool field(const std::string& k, const char* v) { return key(k) && stringValue(v ? v : ""); }
  bool field(const std::string& k, double v) { return key(k) && numberValue(v); }
  bool field(const std::string& k, int v) { return key(k) && intValue(v); }
  bool field(const std::string& k, bool v) { return key(k) && boolValue(v); }

  // True once the single top-level value has been closed.
  bool finished() const { return m_finished; }

private:
  struct Frame {
    enum class Kind : std::uint8_t {
      Object,
      Array,
    };

    Kind kind = Kind::Object;
    bool first = true;
    bool expectingKey = true;
  };

  bool setError(std::string msg);
  bool prepareValue();
  void finishValue();
  void newline(std::size_t depth);
  bool beginContainer(Frame::Kind kind, char openChar);
  bool endContainer(Frame::Kind kind, char closeChar);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

} // namespace tripweave
