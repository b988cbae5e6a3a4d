#include "gridatlas/Json.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <sstream>

namespace gridatlas {

JsonValue JsonValue::MakeNull()
{
  return JsonValue{};
}

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

void AddJsonMember(JsonValue& obj, std::string key, JsonValue value)
{
  if (!obj.isObject()) obj = JsonValue::MakeObject();
  obj.objectValue.emplace_back(std::move(key), std::move(value));
}

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

std::string JsonNumberText(double n)
{
  if (!std::isfinite(n)) return "null";

  // 2^53: every integer below this is exactly representable.
  constexpr double kExactIntLimit = 9007199254740992.0;
  if (n == std::floor(n) && std::fabs(n) < kExactIntLimit) {
    const long long i = static_cast<long long>(n);
    return std::to_string(i);
  }

  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), n);
  if (res.ec != std::errc()) return "null";
  return std::string(buf, res.ptr);
}

namespace {

constexpr int kMaxDepth = 256;

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

class JsonReader {
public:
  explicit JsonReader(const std::string& text) : m_s(text) {}

  bool parseDocument(JsonValue& out)
  {
    if (!parseValue(out, 0)) return false;
    skipWs();
    if (m_pos != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  void skipWs()
  {
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_pos;
    }
  }

  char peek() const { return m_pos < m_s.size() ? m_s[m_pos] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++m_pos;
    return true;
  }

  bool fail(const std::string& msg)
  {
    if (m_err.empty()) m_err = "JSON parse error @" + std::to_string(m_pos) + ": " + msg;
    return false;
  }

  bool literal(const char* word)
  {
    const std::size_t n = std::char_traits<char>::length(word);
    if (m_s.compare(m_pos, n, word) != 0) return fail(std::string("expected '") + word + "'");
    m_pos += n;
    return true;
  }

  bool parseValue(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");

    skipWs();
    switch (peek()) {
    case '\0': return fail("unexpected end of input");
    case 'n':
      if (!literal("null")) return false;
      out = JsonValue::MakeNull();
      return true;
    case 't':
      if (!literal("true")) return false;
      out = JsonValue::MakeBool(true);
      return true;
    case 'f':
      if (!literal("false")) return false;
      out = JsonValue::MakeBool(false);
      return true;
    case '"': {
      std::string s;
      if (!parseString(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case '[': return parseArray(out, depth);
    case '{': return parseObject(out, depth);
    default: break;
    }

    const char c = peek();
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++m_pos;
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = m_pos;
    consume('-');

    if (!consume('0')) {
      if (!digits()) return fail("expected digit");
    }
    if (consume('.')) {
      if (!digits()) return fail("expected digit after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_pos;
      if (peek() == '+' || peek() == '-') ++m_pos;
      if (!digits()) return fail("expected exponent digits");
    }

    double v = 0.0;
    const char* first = m_s.data() + start;
    const char* last = m_s.data() + m_pos;
    const auto res = std::from_chars(first, last, v);
    if (res.ec != std::errc() || res.ptr != last || !std::isfinite(v)) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(std::uint32_t& out)
  {
    if (m_pos + 4 > m_s.size()) return fail("invalid \\u escape");
    std::uint32_t code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_pos++];
      code <<= 4;
      if (h >= '0' && h <= '9') code |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') code |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') code |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    out = code;
    return true;
  }

  bool parseString(std::string& out)
  {
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (m_pos >= m_s.size()) break;
      const char e = m_s[m_pos++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parseHex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate: a low surrogate escape must follow.
          std::uint32_t lo = 0;
          if (!consume('\\') || !consume('u') || !parseHex4(lo) || lo < 0xDC00 || lo > 0xDFFF) {
            return fail("unpaired surrogate in \\u escape");
          }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return fail("unpaired surrogate in \\u escape");
        }
        AppendUtf8(result, cp);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out, int depth)
  {
    consume('[');
    JsonValue arr = JsonValue::MakeArray();

    skipWs();
    if (!consume(']')) {
      for (;;) {
        JsonValue v;
        if (!parseValue(v, depth + 1)) return false;
        arr.arrayValue.push_back(std::move(v));

        skipWs();
        if (consume(']')) break;
        if (!consume(',')) return fail("expected ',' or ']'");
      }
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out, int depth)
  {
    consume('{');
    JsonValue obj = JsonValue::MakeObject();

    skipWs();
    if (!consume('}')) {
      for (;;) {
        skipWs();
        std::string key;
        if (!parseString(key)) return false;

        skipWs();
        if (!consume(':')) return fail("expected ':'");

        JsonValue val;
        if (!parseValue(val, depth + 1)) return false;
        obj.objectValue.emplace_back(std::move(key), std::move(val));

        skipWs();
        if (consume('}')) break;
        if (!consume(',')) return fail("expected ',' or '}'");
      }
    }

    out = std::move(obj);
    return true;
  }

  const std::string& m_s;
  std::size_t m_pos = 0;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  JsonReader reader(text);
  JsonValue v;
  if (!reader.parseDocument(v)) {
    outError = reader.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

// -----------------------------------------------------------------------------
// JsonWriter
// -----------------------------------------------------------------------------

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt)
    : m_os(&os)
    , m_opt(opt)
{
}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

bool JsonWriter::writeRaw(const std::string& s)
{
  m_os->write(s.data(), static_cast<std::streamsize>(s.size()));
  if (!*m_os) return setError("stream write failed");
  return true;
}

void JsonWriter::newlineIndent(std::size_t depth)
{
  if (!m_opt.pretty) return;
  std::string s = "\n";
  s.append(depth * static_cast<std::size_t>(std::max(0, m_opt.indent)), ' ');
  (void)writeRaw(s);
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_finished) return setError("JsonWriter: value after completed document");
  if (m_stack.empty()) return true;

  Frame& top = m_stack.back();
  if (top.kind == Frame::Kind::Object) {
    if (top.expectingKey) return setError("JsonWriter: expected key() before value in object");
    return true;
  }

  if (!top.first && !writeRaw(",")) return false;
  top.first = false;
  newlineIndent(m_stack.size());
  return ok();
}

void JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_finished = true;
    return;
  }
  Frame& top = m_stack.back();
  if (top.kind == Frame::Kind::Object) top.expectingKey = true;
}

bool JsonWriter::beginContainer(Frame::Kind kind, char openChar)
{
  if (!prepareValue()) return false;
  if (!writeRaw(std::string(1, openChar))) return false;
  Frame f;
  f.kind = kind;
  m_stack.push_back(f);
  return true;
}

bool JsonWriter::endContainer(Frame::Kind kind, char closeChar)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != kind) return setError("JsonWriter: mismatched container end");
  if (kind == Frame::Kind::Object && !m_stack.back().expectingKey) {
    return setError("JsonWriter: object closed after key() without value");
  }

  const bool empty = m_stack.back().first;
  m_stack.pop_back();
  if (!empty) newlineIndent(m_stack.size());
  if (!writeRaw(std::string(1, closeChar))) return false;
  finishValue();
  return true;
}

bool JsonWriter::beginObject() { return beginContainer(Frame::Kind::Object, '{'); }
bool JsonWriter::endObject() { return endContainer(Frame::Kind::Object, '}'); }
bool JsonWriter::beginArray() { return beginContainer(Frame::Kind::Array, '['); }
bool JsonWriter::endArray() { return endContainer(Frame::Kind::Array, ']'); }

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != Frame::Kind::Object) {
    return setError("JsonWriter: key() outside of object");
  }
  Frame& top = m_stack.back();
  if (!top.expectingKey) return setError("JsonWriter: key() called twice");

  if (!top.first && !writeRaw(",")) return false;
  top.first = false;
  newlineIndent(m_stack.size());

  std::string s = "\"" + JsonEscape(k) + "\":";
  if (m_opt.pretty) s.push_back(' ');
  if (!writeRaw(s)) return false;
  top.expectingKey = false;
  return true;
}

bool JsonWriter::nullValue()
{
  if (!prepareValue() || !writeRaw("null")) return false;
  finishValue();
  return true;
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue() || !writeRaw(b ? "true" : "false")) return false;
  finishValue();
  return true;
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return setError("JsonWriter: non-finite number");
  if (!prepareValue() || !writeRaw(JsonNumberText(n))) return false;
  finishValue();
  return true;
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue() || !writeRaw(std::to_string(n))) return false;
  finishValue();
  return true;
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue() || !writeRaw("\"" + JsonEscape(s) + "\"")) return false;
  finishValue();
  return true;
}

bool JsonWriter::value(const JsonValue& v)
{
  switch (v.type) {
  case JsonValue::Type::Null: return nullValue();
  case JsonValue::Type::Bool: return boolValue(v.boolValue);
  case JsonValue::Type::Number: return numberValue(v.numberValue);
  case JsonValue::Type::String: return stringValue(v.stringValue);
  case JsonValue::Type::Array:
    if (!beginArray()) return false;
    for (const JsonValue& e : v.arrayValue) {
      if (!value(e)) return false;
    }
    return endArray();
  case JsonValue::Type::Object: {
    if (!beginObject()) return false;
    std::vector<const std::pair<std::string, JsonValue>*> members;
    members.reserve(v.objectValue.size());
    for (const auto& kv : v.objectValue) members.push_back(&kv);
    if (m_opt.sortKeys) {
      std::stable_sort(members.begin(), members.end(),
                       [](const auto* a, const auto* b) { return a->first < b->first; });
    }
    for (const auto* kv : members) {
      if (!key(kv->first) || !value(kv->second)) return false;
    }
    return endObject();
  }
  }
  return setError("JsonWriter: unknown value type");
}

namespace {

// Replace non-finite numbers with null so JsonStringify never fails.
JsonValue SanitizeNonFinite(const JsonValue& v)
{
  if (v.isNumber() && !std::isfinite(v.numberValue)) return JsonValue::MakeNull();
  JsonValue out = v;
  for (JsonValue& e : out.arrayValue) e = SanitizeNonFinite(e);
  for (auto& kv : out.objectValue) kv.second = SanitizeNonFinite(kv.second);
  return out;
}

} // namespace

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  outError.clear();
  JsonWriter w(os, opt);
  if (!w.value(value)) {
    outError = w.error();
    return false;
  }
  if (opt.pretty) os << '\n';
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  std::string err;
  if (!WriteJson(oss, value, err, opt)) {
    std::ostringstream retry;
    (void)WriteJson(retry, SanitizeNonFinite(value), err, opt);
    return retry.str();
  }
  return oss.str();
}

} // namespace gridatlas
