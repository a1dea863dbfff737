#include "wangpaint/Json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace wangpaint {

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

void JsonValue::add(std::string key, JsonValue v)
{
  if (!isObject()) return;
  objectValue.emplace_back(std::move(key), std::move(v));
}

void JsonValue::push(JsonValue v)
{
  if (!isArray()) return;
  arrayValue.push_back(std::move(v));
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";

  std::string out;
  out.reserve(s.size() + 2);
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

namespace {

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
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
  // Deep nesting in a hand-edited file is almost certainly a mistake, and it
  // keeps the recursion bounded.
  static constexpr int kMaxDepth = 256;

  char peek() const { return m_i < m_s.size() ? m_s[m_i] : '\0'; }
  bool atEnd() const { return m_i >= m_s.size(); }

  void skipWs()
  {
    while (!atEnd()) {
      const char c = m_s[m_i];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_i;
    }
  }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++m_i;
    return true;
  }

  bool fail(const std::string& msg)
  {
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

  bool literal(const char* word, std::size_t len)
  {
    if (m_s.compare(m_i, len, word) != 0) return fail(std::string("expected '") + word + "'");
    m_i += len;
    return true;
  }

  bool parseValue(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");

    skipWs();
    const char c = peek();
    if (atEnd()) return fail("unexpected end of input");

    switch (c) {
    case 'n':
      if (!literal("null", 4)) return false;
      out = JsonValue::MakeNull();
      return true;
    case 't':
      if (!literal("true", 4)) return false;
      out = JsonValue::MakeBool(true);
      return true;
    case 'f':
      if (!literal("false", 5)) return false;
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

    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);
    return fail(std::string("unexpected character '") + c + "'");
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++m_i;
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = m_i;
    consume('-');

    if (!consume('0')) {
      if (!digits()) return fail("expected digit");
    }
    if (consume('.')) {
      if (!digits()) return fail("expected digit after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (peek() == '+' || peek() == '-') ++m_i;
      if (!digits()) return fail("expected exponent digits");
    }

    const std::string num = m_s.substr(start, m_i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(num.c_str(), &end);
    if (errno == ERANGE || end == nullptr || *end != '\0') {
      m_i = start;
      return fail("invalid number '" + num + "'");
    }

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool hex4(std::uint32_t& out)
  {
    if (m_i + 4 > m_s.size()) return fail("truncated \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (!atEnd()) {
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

      if (atEnd()) break;
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
        if (!hex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate: a low surrogate must follow.
          std::uint32_t lo = 0;
          if (!consume('\\') || !consume('u')) return fail("unpaired surrogate in \\u escape");
          if (!hex4(lo)) return false;
          if (lo < 0xDC00 || lo > 0xDFFF) return fail("invalid low surrogate in \\u escape");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          return fail("unpaired surrogate in \\u escape");
        }
        AppendUtf8(result, cp);
        break;
      }
      default: return fail(std::string("unknown escape '\\") + e + "'");
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

        JsonValue v;
        if (!parseValue(v, depth + 1)) return false;
        obj.objectValue.emplace_back(std::move(key), std::move(v));

        skipWs();
        if (consume('}')) break;
        if (!consume(',')) return fail("expected ',' or '}'");
      }
    }

    out = std::move(obj);
    return true;
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

std::string NumberToJson(double v)
{
  if (!std::isfinite(v)) return "null";

  // Integral values (tile ids, sizes) print without a fraction.
  if (std::fabs(v) < 9007199254740992.0 && std::floor(v) == v) {
    return std::to_string(static_cast<long long>(v));
  }

  std::ostringstream oss;
  oss.precision(9);
  oss << v;
  return oss.str();
}

bool IsScalar(const JsonValue& v)
{
  return !v.isArray() && !v.isObject();
}

void WriteValue(std::string& out, const JsonValue& v, const JsonWriteOptions& opt, int depth)
{
  const auto newline = [&](int d) {
    if (!opt.pretty) return;
    out.push_back('\n');
    out.append(static_cast<std::size_t>(d * opt.indent), ' ');
  };

  switch (v.type) {
  case JsonValue::Type::Null: out += "null"; return;
  case JsonValue::Type::Bool: out += v.boolValue ? "true" : "false"; return;
  case JsonValue::Type::Number: out += NumberToJson(v.numberValue); return;
  case JsonValue::Type::String:
    out.push_back('"');
    out += JsonEscape(v.stringValue);
    out.push_back('"');
    return;
  case JsonValue::Type::Array: {
    if (v.arrayValue.empty()) {
      out += "[]";
      return;
    }
    bool flat = opt.inlineScalarArrays;
    for (const JsonValue& e : v.arrayValue) flat = flat && IsScalar(e);

    out.push_back('[');
    for (std::size_t k = 0; k < v.arrayValue.size(); ++k) {
      if (k) out += (flat && opt.pretty) ? ", " : ",";
      if (!flat) newline(depth + 1);
      WriteValue(out, v.arrayValue[k], opt, depth + 1);
    }
    if (!flat) newline(depth);
    out.push_back(']');
    return;
  }
  case JsonValue::Type::Object: {
    if (v.objectValue.empty()) {
      out += "{}";
      return;
    }
    out.push_back('{');
    for (std::size_t k = 0; k < v.objectValue.size(); ++k) {
      if (k) out.push_back(',');
      newline(depth + 1);
      out.push_back('"');
      out += JsonEscape(v.objectValue[k].first);
      out += opt.pretty ? "\": " : "\":";
      WriteValue(out, v.objectValue[k].second, opt, depth + 1);
    }
    newline(depth);
    out.push_back('}');
    return;
  }
  }
}

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

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::string out;
  WriteValue(out, value, opt, 0);
  if (opt.pretty) out.push_back('\n');
  return out;
}

bool ReadFileText(const std::string& path, std::string& out, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  out = oss.str();
  return true;
}

bool WriteFileText(const std::string& path, const std::string& text, std::string& outError)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  f << text;
  if (!f) {
    outError = "failed to write file: " + path;
    return false;
  }
  return true;
}

bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::string text;
  if (!ReadFileText(path, text, outError)) return false;

  std::string err;
  if (!ParseJson(text, outValue, err)) {
    outError = path + ": " + err;
    return false;
  }
  return true;
}

} // namespace wangpaint
