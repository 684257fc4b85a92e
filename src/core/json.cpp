// core/json.cpp - JSON parser and printer
#include "json.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace saveli {
namespace json {

static const char *type_name(Value::Type type) {
  switch (type) {
  case Value::Type::Null:
    return "null";
  case Value::Type::Bool:
    return "boolean";
  case Value::Type::Number:
    return "number";
  case Value::Type::String:
    return "string";
  case Value::Type::Array:
    return "array";
  case Value::Type::Object:
    return "object";
  }
  return "unknown";
}

static Error type_error(const char *expected, Value::Type actual) {
  return Error(std::string("Expected ") + expected + ", found " +
               type_name(actual));
}

Value Value::array() {
  Value v;
  v.type_ = Type::Array;
  return v;
}

Value Value::object() {
  Value v;
  v.type_ = Type::Object;
  return v;
}

bool Value::as_bool() const {
  if (type_ != Type::Bool)
    throw type_error("boolean", type_);
  return bool_;
}

int64_t Value::as_int() const {
  if (type_ != Type::Number)
    throw type_error("number", type_);
  if (!integral_ && std::floor(number_) != number_)
    throw Error("Expected integer, found " + std::to_string(number_));
  // 2^63 is the first double outside the int64_t range
  if (number_ >= 9223372036854775808.0 || number_ < -9223372036854775808.0)
    throw Error("Integer out of range: " + std::to_string(number_));
  return static_cast<int64_t>(number_);
}

double Value::as_double() const {
  if (type_ != Type::Number)
    throw type_error("number", type_);
  return number_;
}

const std::string &Value::as_string() const {
  if (type_ != Type::String)
    throw type_error("string", type_);
  return string_;
}

const std::vector<Value> &Value::items() const {
  if (type_ != Type::Array)
    throw type_error("array", type_);
  return items_;
}

void Value::push_back(Value v) {
  if (type_ != Type::Array)
    throw type_error("array", type_);
  items_.push_back(std::move(v));
}

const std::vector<Value::Member> &Value::members() const {
  if (type_ != Type::Object)
    throw type_error("object", type_);
  return members_;
}

const Value *Value::find(const std::string &key) const {
  if (type_ != Type::Object)
    return nullptr;
  for (const auto &member : members_) {
    if (member.first == key)
      return &member.second;
  }
  return nullptr;
}

const Value &Value::at(const std::string &key) const {
  if (type_ != Type::Object)
    throw type_error("object", type_);
  const Value *v = find(key);
  if (!v)
    throw Error("Missing key \"" + key + "\"");
  return *v;
}

Value &Value::operator[](const std::string &key) {
  if (type_ == Type::Null)
    type_ = Type::Object;
  if (type_ != Type::Object)
    throw type_error("object", type_);
  for (auto &member : members_) {
    if (member.first == key)
      return member.second;
  }
  members_.emplace_back(key, Value());
  return members_.back().second;
}

size_t Value::size() const {
  if (type_ == Type::Array)
    return items_.size();
  if (type_ == Type::Object)
    return members_.size();
  return 0;
}

// Parser

namespace {

class Parser {
public:
  explicit Parser(const std::string &text) : text_(text) {}

  Value parse_document() {
    skip_ws();
    Value v = parse_value(0);
    skip_ws();
    if (pos_ != text_.size())
      fail("Trailing characters after document");
    return v;
  }

private:
  static constexpr int MAX_DEPTH = 256;

  const std::string &text_;
  size_t pos_ = 0;

  [[noreturn]] void fail(const std::string &what) const {
    throw Error(what + " at offset " + std::to_string(pos_), pos_);
  }

  bool eof() const { return pos_ >= text_.size(); }
  char peek() const { return eof() ? '\0' : text_[pos_]; }

  void skip_ws() {
    while (!eof()) {
      char c = text_[pos_];
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r')
        ++pos_;
      else
        break;
    }
  }

  void expect(char c) {
    if (peek() != c)
      fail(std::string("Expected '") + c + "'");
    ++pos_;
  }

  void expect_literal(const char *lit) {
    for (const char *p = lit; *p; ++p) {
      if (peek() != *p)
        fail(std::string("Invalid literal, expected ") + lit);
      ++pos_;
    }
  }

  Value parse_value(int depth) {
    if (depth > MAX_DEPTH)
      fail("Document nested too deeply");

    switch (peek()) {
    case '{':
      return parse_object(depth);
    case '[':
      return parse_array(depth);
    case '"':
      return Value(parse_string());
    case 't':
      expect_literal("true");
      return Value(true);
    case 'f':
      expect_literal("false");
      return Value(false);
    case 'n':
      expect_literal("null");
      return Value();
    default:
      if (peek() == '-' || (peek() >= '0' && peek() <= '9'))
        return parse_number();
      if (eof())
        fail("Unexpected end of input");
      fail(std::string("Unexpected character '") + peek() + "'");
    }
  }

  Value parse_object(int depth) {
    expect('{');
    Value obj = Value::object();
    skip_ws();
    if (peek() == '}') {
      ++pos_;
      return obj;
    }
    while (true) {
      skip_ws();
      if (peek() != '"')
        fail("Expected object key");
      std::string key = parse_string();
      skip_ws();
      expect(':');
      skip_ws();
      obj[key] = parse_value(depth + 1);
      skip_ws();
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      expect('}');
      return obj;
    }
  }

  Value parse_array(int depth) {
    expect('[');
    Value arr = Value::array();
    skip_ws();
    if (peek() == ']') {
      ++pos_;
      return arr;
    }
    while (true) {
      skip_ws();
      arr.push_back(parse_value(depth + 1));
      skip_ws();
      if (peek() == ',') {
        ++pos_;
        continue;
      }
      expect(']');
      return arr;
    }
  }

  Value parse_number() {
    size_t start = pos_;
    bool integral = true;

    if (peek() == '-')
      ++pos_;
    if (peek() == '0') {
      ++pos_;
    } else if (peek() >= '1' && peek() <= '9') {
      while (peek() >= '0' && peek() <= '9')
        ++pos_;
    } else {
      fail("Invalid number");
    }
    if (peek() == '.') {
      integral = false;
      ++pos_;
      if (!(peek() >= '0' && peek() <= '9'))
        fail("Invalid number");
      while (peek() >= '0' && peek() <= '9')
        ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      integral = false;
      ++pos_;
      if (peek() == '+' || peek() == '-')
        ++pos_;
      if (!(peek() >= '0' && peek() <= '9'))
        fail("Invalid number");
      while (peek() >= '0' && peek() <= '9')
        ++pos_;
    }

    std::string token = text_.substr(start, pos_ - start);
    if (integral) {
      errno = 0;
      long long n = std::strtoll(token.c_str(), nullptr, 10);
      if (errno != ERANGE)
        return Value(static_cast<int64_t>(n));
    }
    return Value(std::strtod(token.c_str(), nullptr));
  }

  unsigned parse_hex4() {
    if (pos_ + 4 > text_.size())
      fail("Truncated unicode escape");
    unsigned cp = 0;
    for (int i = 0; i < 4; ++i) {
      char c = text_[pos_++];
      cp <<= 4;
      if (c >= '0' && c <= '9')
        cp |= c - '0';
      else if (c >= 'a' && c <= 'f')
        cp |= c - 'a' + 10;
      else if (c >= 'A' && c <= 'F')
        cp |= c - 'A' + 10;
      else
        fail("Invalid unicode escape");
    }
    return cp;
  }

  static void append_utf8(std::string &out, unsigned cp) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string parse_string() {
    expect('"');
    std::string out;
    while (true) {
      if (eof())
        fail("Unterminated string");
      char c = text_[pos_++];
      if (c == '"')
        return out;
      if (static_cast<unsigned char>(c) < 0x20)
        fail("Control character in string");
      if (c != '\\') {
        out += c;
        continue;
      }
      if (eof())
        fail("Unterminated escape");
      char e = text_[pos_++];
      switch (e) {
      case '"':
        out += '"';
        break;
      case '\\':
        out += '\\';
        break;
      case '/':
        out += '/';
        break;
      case 'b':
        out += '\b';
        break;
      case 'f':
        out += '\f';
        break;
      case 'n':
        out += '\n';
        break;
      case 'r':
        out += '\r';
        break;
      case 't':
        out += '\t';
        break;
      case 'u': {
        unsigned cp = parse_hex4();
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          if (text_.compare(pos_, 2, "\\u") != 0)
            fail("Unpaired surrogate");
          pos_ += 2;
          unsigned low = parse_hex4();
          if (low < 0xDC00 || low > 0xDFFF)
            fail("Invalid low surrogate");
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        append_utf8(out, cp);
        break;
      }
      default:
        fail(std::string("Invalid escape '\\") + e + "'");
      }
    }
  }
};

} // namespace

Value parse(const std::string &text) { return Parser(text).parse_document(); }

// Printer

static void dump_string(std::ostringstream &out, const std::string &s) {
  out << '"';
  for (char c : s) {
    switch (c) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buf[8];
        snprintf(buf, sizeof(buf), "\\u%04x", c);
        out << buf;
      } else {
        out << c;
      }
    }
  }
  out << '"';
}

static void newline(std::ostringstream &out, int indent, int level) {
  if (indent < 0)
    return;
  out << '\n' << std::string(static_cast<size_t>(indent * level), ' ');
}

static void dump_value(std::ostringstream &out, const Value &v, int indent,
                       int level) {
  switch (v.type()) {
  case Value::Type::Null:
    out << "null";
    break;
  case Value::Type::Bool:
    out << (v.as_bool() ? "true" : "false");
    break;
  case Value::Type::Number:
    if (v.is_integer()) {
      out << v.as_int();
    } else {
      char buf[32];
      snprintf(buf, sizeof(buf), "%.17g", v.as_double());
      out << buf;
    }
    break;
  case Value::Type::String:
    dump_string(out, v.as_string());
    break;
  case Value::Type::Array: {
    const auto &items = v.items();
    if (items.empty()) {
      out << "[]";
      break;
    }
    out << '[';
    for (size_t i = 0; i < items.size(); ++i) {
      if (i > 0)
        out << ',';
      newline(out, indent, level + 1);
      dump_value(out, items[i], indent, level + 1);
    }
    newline(out, indent, level);
    out << ']';
    break;
  }
  case Value::Type::Object: {
    const auto &members = v.members();
    if (members.empty()) {
      out << "{}";
      break;
    }
    out << '{';
    for (size_t i = 0; i < members.size(); ++i) {
      if (i > 0)
        out << ',';
      newline(out, indent, level + 1);
      dump_string(out, members[i].first);
      out << (indent < 0 ? ":" : ": ");
      dump_value(out, members[i].second, indent, level + 1);
    }
    newline(out, indent, level);
    out << '}';
    break;
  }
  }
}

std::string dump(const Value &value, int indent) {
  std::ostringstream out;
  dump_value(out, value, indent, 0);
  return out.str();
}

} // namespace json
} // namespace saveli
