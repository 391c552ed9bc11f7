#include "tripweave/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <locale>
#include <ostream>
#include <sstream>

namespace tripweave {

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

const char* JsonTypeName(JsonValue::Type t)
{
  switch (t) {
  case JsonValue::Type::Null: return "null";
  case JsonValue::Type::Bool: return "boolean";
  case JsonValue::Type::Number: return "number";
  case JsonValue::Type::String: return "string";
  case JsonValue::Type::Array: return "array";
  case JsonValue::Type::Object: return "object";
  }
  return "unknown";
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

namespace {

// Quotes are added by the caller; UTF-8 passes through unchanged.
std::string EscapeString(const std::string& s)
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

class Parser {
public:
  explicit Parser(const std::string& text) : m_s(text) {}

  bool parseDocument(JsonValue& out)
  {
    if (!parseValue(out, 0)) return false;
    skipWs();
    if (m_i != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  static constexpr int kMaxDepth = 256;

  void skipWs()
  {
    while (m_i < m_s.size()) {
      const char c = m_s[m_i];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_i;
    }
  }

  char peek() const { return m_i < m_s.size() ? m_s[m_i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++m_i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    // Report a 1-based line/column; catalogs are hand-edited often enough.
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < m_i && k < m_s.size(); ++k) {
      if (m_s[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream oss;
    oss << "JSON parse error at line " << line << ", column " << col << ": " << msg;
    m_err = oss.str();
    return false;
  }

  bool literal(const char* word)
  {
    std::size_t n = 0;
    while (word[n] != '\0') ++n;
    if (m_s.compare(m_i, n, word) != 0) return false;
    m_i += n;
    return true;
  }

  bool parseValue(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");

    skipWs();
    const char c = peek();
    if (c == '\0') return fail("unexpected end of input");

    if (c == 'n') {
      if (!literal("null")) return fail("expected 'null'");
      out = JsonValue::MakeNull();
      return true;
    }
    if (c == 't') {
      if (!literal("true")) return fail("expected 'true'");
      out = JsonValue::MakeBool(true);
      return true;
    }
    if (c == 'f') {
      if (!literal("false")) return fail("expected 'false'");
      out = JsonValue::MakeBool(false);
      return true;
    }
    if (c == '"') {
      std::string str;
      if (!parseString(str)) return false;
      out = JsonValue::MakeString(std::move(str));
      return true;
    }
    if (c == '[') return parseArray(out, depth);
    if (c == '{') return parseObject(out, depth);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = m_i;
    auto digits = [&]() {
      std::size_t n = 0;
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) {
        ++m_i;
        ++n;
      }
      return n;
    };

    consume('-');
    if (!consume('0')) {
      if (digits() == 0) return fail("expected digit");
    }
    if (consume('.')) {
      if (digits() == 0) return fail("expected digit after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (peek() == '+' || peek() == '-') ++m_i;
      if (digits() == 0) return fail("expected exponent digits");
    }

    const std::string numStr = m_s.substr(start, m_i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    if (errno != 0 || end == numStr.c_str() || (end && *end != '\0') || !std::isfinite(v)) {
      return fail("invalid number '" + numStr + "'");
    }

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(std::uint32_t& out)
  {
    if (m_i + 4 > m_s.size()) return fail("truncated \\u escape");
    std::uint32_t code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_i++];
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
    while (m_i < m_s.size()) {
      const char c = m_s[m_i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (m_i >= m_s.size()) return fail("unterminated escape sequence");
      const char e = m_s[m_i++];
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
          if (!(consume('\\') && consume('u'))) return fail("unpaired surrogate in \\u escape");
          std::uint32_t lo = 0;
          if (!parseHex4(lo)) return false;
          if (lo < 0xDC00 || lo > 0xDFFF) return fail("invalid low surrogate in \\u escape");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return fail("unpaired surrogate in \\u escape");
        }
        AppendUtf8(result, cp);
        break;
      }
      default: return fail(std::string("unknown escape sequence '\\") + e + "'");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out, int depth)
  {
    consume('[');
    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (consume(']')) {
      out = std::move(arr);
      return true;
    }

    while (true) {
      JsonValue v;
      if (!parseValue(v, depth + 1)) return false;
      arr.arrayValue.push_back(std::move(v));

      skipWs();
      if (consume(']')) break;
      if (!consume(',')) return fail("expected ',' or ']'");
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out, int depth)
  {
    consume('{');
    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (consume('}')) {
      out = std::move(obj);
      return true;
    }

    while (true) {
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

    out = std::move(obj);
    return true;
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseDocument(v)) {
    outError = p.error();
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "unable to open '" + path + "'";
    return false;
  }

  std::ostringstream oss;
  oss << f.rdbuf();
  if (!f.good() && !f.eof()) {
    outError = "failed to read '" + path + "'";
    return false;
  }

  std::string text = oss.str();
  // Tolerate a UTF-8 BOM; some editors add one to exported catalogs.
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF) {
    text.erase(0, 3);
  }

  if (!ParseJson(text, outValue, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------------------------
// JsonWriter
// -----------------------------------------------------------------------------------------------

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

void JsonWriter::newline(std::size_t depth)
{
  if (!m_opt.pretty) return;
  (*m_os) << '\n';
  for (std::size_t i = 0; i < depth * static_cast<std::size_t>(m_opt.indent); ++i) (*m_os) << ' ';
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_finished) return setError("JsonWriter: value after document end");

  if (m_stack.empty()) return true;

  Frame& top = m_stack.back();
  if (top.kind == Frame::Kind::Object) {
    if (top.expectingKey) return setError("JsonWriter: value without key inside object");
    return true;
  }

  if (!top.first) (*m_os) << ',';
  newline(m_stack.size());
  top.first = false;
  return true;
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
  (*m_os) << openChar;
  Frame f;
  f.kind = kind;
  m_stack.push_back(f);
  return static_cast<bool>(*m_os) || setError("JsonWriter: stream failure");
}

bool JsonWriter::endContainer(Frame::Kind kind, char closeChar)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != kind) return setError("JsonWriter: mismatched close");
  if (kind == Frame::Kind::Object && !m_stack.back().expectingKey) {
    return setError("JsonWriter: key without value");
  }

  const bool empty = m_stack.back().first;
  m_stack.pop_back();
  if (!empty) newline(m_stack.size());
  (*m_os) << closeChar;
  finishValue();
  if (m_finished && m_opt.pretty) (*m_os) << '\n';
  return static_cast<bool>(*m_os) || setError("JsonWriter: stream failure");
}

bool JsonWriter::beginObject()
{
  return beginContainer(Frame::Kind::Object, '{');
}

bool JsonWriter::endObject()
{
  return endContainer(Frame::Kind::Object, '}');
}

bool JsonWriter::beginArray()
{
  return beginContainer(Frame::Kind::Array, '[');
}

bool JsonWriter::endArray()
{
  return endContainer(Frame::Kind::Array, ']');
}

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != Frame::Kind::Object) {
    return setError("JsonWriter: key outside object");
  }

  Frame& top = m_stack.back();
  if (!top.expectingKey) return setError("JsonWriter: two keys in a row");

  if (!top.first) (*m_os) << ',';
  newline(m_stack.size());
  top.first = false;
  top.expectingKey = false;

  (*m_os) << '"' << EscapeString(k) << "\":";
  if (m_opt.pretty) (*m_os) << ' ';
  return true;
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue()) return false;
  (*m_os) << (b ? "true" : "false");
  finishValue();
  return true;
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return setError("JsonWriter: non-finite number");
  if (!prepareValue()) return false;

  // Shortest round-trippable-ish representation without locale surprises.
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::setprecision(12) << n;
  (*m_os) << oss.str();
  finishValue();
  return true;
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue()) return false;
  (*m_os) << n;
  finishValue();
  return true;
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue()) return false;
  (*m_os) << '"' << EscapeString(s) << '"';
  finishValue();
  return true;
}

} // namespace tripweave
