#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace gridatlas {

// Minimal JSON value representation and parser.
//
// Used for configuration files, JSON Lines item tables and the exported
// documents, so the core stays free of third-party JSON libraries.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects keep their members as an ordered list of key/value pairs.
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

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

// Append a member to an object value (no duplicate check).
void AddJsonMember(JsonValue& obj, std::string key, JsonValue value);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Escape a string to be used inside a JSON string literal (without surrounding quotes).
std::string JsonEscape(const std::string& s);

// Shortest text that round-trips the double. Integral values within 2^53 are
// written without a fractional part. Non-finite input yields "null".
std::string JsonNumberText(double n);

struct JsonWriteOptions {
  // Pretty-print with newlines + indentation.
  bool pretty = true;

  // Spaces per indentation level when pretty-printing.
  int indent = 2;

  // Sort object keys lexicographically (useful for deterministic outputs).
  bool sortKeys = false;
};

// Serialize a JsonValue to a stream.
//
// Returns false on non-finite numbers (NaN/Inf) or stream failures.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError,
               const JsonWriteOptions& opt = {});

// Serialize a JsonValue to a string. Non-finite numbers are written as null.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

// -----------------------------------------------------------------------------
// JsonWriter
//
// Streaming writer for large documents (one per grid resolution) that should
// not be built as a full JsonValue tree first.
//
// Notes:
//  - Callers control key order; nothing is sorted automatically.
//  - On misuse, the writer stores an error message and subsequent calls return false.
// -----------------------------------------------------------------------------
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  // Object member key (must be inside an object).
  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool stringValue(const std::string& s);

  // Serialize a JsonValue subtree in the current context.
  bool value(const JsonValue& v);

  // Convenience: key + primitive.
  bool member(const std::string& k, const std::string& s) { return key(k) && stringValue(s); }
  bool member(const std::string& k, double n) { return key(k) && numberValue(n); }
  bool memberInt(const std::string& k, std::int64_t n) { return key(k) && intValue(n); }

  // True once the top-level value has been completed.
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
  bool writeRaw(const std::string& s);
  void newlineIndent(std::size_t depth);

  bool prepareValue();
  void finishValue();

  bool beginContainer(Frame::Kind kind, char openChar);
  bool endContainer(Frame::Kind kind, char closeChar);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

} // namespace gridatlas
