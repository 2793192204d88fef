#include "parcelcity/Json.hpp"

#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>

namespace parcelcity {

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

void JsonValue::set(std::string key, JsonValue v)
{
  if (type != Type::Object) return;
  objectValue.emplace_back(std::move(key), std::move(v));
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
  for (const char c : s) {
    const unsigned char ch = static_cast<unsigned char>(c);
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(c);
      }
      break;
    }
  }
  return out;
}

namespace {

class Reader {
public:
  explicit Reader(const std::string& text) : m_s(text) {}

  bool document(JsonValue& out)
  {
    if (!value(out, 0)) return false;
    skipWs();
    if (m_pos != m_s.size()) return fail("trailing characters");
    return true;
  }

  const std::string& error() const { return m_err; }

private:
  static constexpr int kMaxDepth = 64;

  bool fail(const char* why)
  {
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < m_pos && k < m_s.size(); ++k) {
      if (m_s[k] == '\n') {
        line++;
        col = 1;
      } else {
        col++;
      }
    }
    std::ostringstream oss;
    oss << "JSON parse error at " << line << ":" << col << ": " << why;
    m_err = oss.str();
    return false;
  }

  void skipWs()
  {
    while (m_pos < m_s.size()) {
      const char c = m_s[m_pos];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      m_pos++;
    }
  }

  bool atEnd() const { return m_pos >= m_s.size(); }
  char cur() const { return atEnd() ? '\0' : m_s[m_pos]; }

  bool literal(const char* word)
  {
    const std::string w(word);
    if (m_s.compare(m_pos, w.size(), w) != 0) return fail("invalid literal");
    m_pos += w.size();
    return true;
  }

  bool value(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");

    skipWs();
    if (atEnd()) return fail("unexpected end of input");

    switch (cur()) {
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
      if (!readString(s)) return false;
      out = JsonValue::MakeString(std::move(s));
      return true;
    }
    case '[': return array(out, depth);
    case '{': return object(out, depth);
    default: break;
    }

    if (cur() == '-' || std::isdigit(static_cast<unsigned char>(cur())) != 0) return number(out);
    return fail("unexpected character");
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(cur())) == 0) return fail("expected digit");
    while (std::isdigit(static_cast<unsigned char>(cur())) != 0) m_pos++;
    return true;
  }

  bool number(JsonValue& out)
  {
    const std::size_t start = m_pos;
    if (cur() == '-') m_pos++;

    if (cur() == '0') {
      m_pos++;
    } else if (!digits()) {
      return false;
    }

    if (cur() == '.') {
      m_pos++;
      if (!digits()) return false;
    }

    if (cur() == 'e' || cur() == 'E') {
      m_pos++;
      if (cur() == '+' || cur() == '-') m_pos++;
      if (!digits()) return false;
    }

    const std::string text = m_s.substr(start, m_pos - start);
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (!end || *end != '\0' || !std::isfinite(v)) return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool hex4(unsigned int& out)
  {
    out = 0;
    for (int k = 0; k < 4; ++k) {
      if (atEnd()) return fail("truncated \\u escape");
      const char h = m_s[m_pos++];
      out <<= 4;
      if (h >= '0' && h <= '9') {
        out |= static_cast<unsigned int>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        out |= static_cast<unsigned int>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        out |= static_cast<unsigned int>(h - 'A' + 10);
      } else {
        return fail("bad hex digit in \\u escape");
      }
    }
    return true;
  }

  static void appendUtf8(std::string& s, unsigned int cp)
  {
    if (cp < 0x80) {
      s.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      s.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      s.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  bool readString(std::string& out)
  {
    m_pos++; // opening quote
    out.clear();

    while (!atEnd()) {
      const char c = m_s[m_pos++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (atEnd()) break;
      const char e = m_s[m_pos++];
      switch (e) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        unsigned int cp = 0;
        if (!hex4(cp)) return false;
        // Surrogate pairs are not decoded; keep the text readable.
        if (cp >= 0xD800 && cp <= 0xDFFF) cp = '?';
        appendUtf8(out, cp);
        break;
      }
      default: return fail("unknown escape");
      }
    }
    return fail("unterminated string");
  }

  bool array(JsonValue& out, int depth)
  {
    m_pos++; // '['
    out = JsonValue::MakeArray();

    skipWs();
    if (cur() == ']') {
      m_pos++;
      return true;
    }

    for (;;) {
      JsonValue item;
      if (!value(item, depth + 1)) return false;
      out.arrayValue.push_back(std::move(item));

      skipWs();
      if (cur() == ',') {
        m_pos++;
        continue;
      }
      if (cur() == ']') {
        m_pos++;
        return true;
      }
      return fail("expected ',' or ']'");
    }
  }

  bool object(JsonValue& out, int depth)
  {
    m_pos++; // '{'
    out = JsonValue::MakeObject();

    skipWs();
    if (cur() == '}') {
      m_pos++;
      return true;
    }

    for (;;) {
      skipWs();
      if (cur() != '"') return fail("expected member name");
      std::string key;
      if (!readString(key)) return false;

      skipWs();
      if (cur() != ':') return fail("expected ':'");
      m_pos++;

      JsonValue member;
      if (!value(member, depth + 1)) return false;
      out.objectValue.emplace_back(std::move(key), std::move(member));

      skipWs();
      if (cur() == ',') {
        m_pos++;
        continue;
      }
      if (cur() == '}') {
        m_pos++;
        return true;
      }
      return fail("expected ',' or '}'");
    }
  }

  const std::string& m_s;
  std::size_t m_pos = 0;
  std::string m_err;
};

std::string NumberToJson(double v)
{
  // Integral values print without a fraction so configs stay readable.
  if (std::fabs(v) < 9.0e15 && std::floor(v) == v) {
    std::ostringstream oss;
    oss << static_cast<long long>(v);
    return oss.str();
  }
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  return oss.str();
}

bool WriteValue(std::ostream& os, const JsonValue& v, const JsonWriteOptions& opt, int depth, std::string& err)
{
  auto newline = [&](int d) {
    if (!opt.pretty) return;
    os << '\n';
    for (int k = 0; k < d * opt.indent; ++k) os << ' ';
  };

  switch (v.type) {
  case JsonValue::Type::Null: os << "null"; break;
  case JsonValue::Type::Bool: os << (v.boolValue ? "true" : "false"); break;
  case JsonValue::Type::Number:
    if (!std::isfinite(v.numberValue)) {
      err = "cannot write non-finite number";
      return false;
    }
    os << NumberToJson(v.numberValue);
    break;
  case JsonValue::Type::String: os << '"' << JsonEscape(v.stringValue) << '"'; break;
  case JsonValue::Type::Array:
    os << '[';
    for (std::size_t k = 0; k < v.arrayValue.size(); ++k) {
      if (k) os << ',';
      newline(depth + 1);
      if (!WriteValue(os, v.arrayValue[k], opt, depth + 1, err)) return false;
    }
    if (!v.arrayValue.empty()) newline(depth);
    os << ']';
    break;
  case JsonValue::Type::Object:
    os << '{';
    for (std::size_t k = 0; k < v.objectValue.size(); ++k) {
      if (k) os << ',';
      newline(depth + 1);
      os << '"' << JsonEscape(v.objectValue[k].first) << "\":";
      if (opt.pretty) os << ' ';
      if (!WriteValue(os, v.objectValue[k].second, opt, depth + 1, err)) return false;
    }
    if (!v.objectValue.empty()) newline(depth);
    os << '}';
    break;
  }
  return true;
}

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Reader r(text);
  JsonValue v;
  if (!r.document(v)) {
    outError = r.error();
    return false;
  }
  outValue = std::move(v);
  outError.clear();
  return true;
}

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  outError.clear();
  if (!WriteValue(os, value, opt, 0, outError)) return false;
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
  if (!WriteJson(oss, value, err, opt)) return std::string();
  return oss.str();
}

} // namespace parcelcity
