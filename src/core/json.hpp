// core/json.hpp - Minimal JSON document model
#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace saveli {
namespace json {

class Error : public std::runtime_error {
public:
  Error(const std::string &message, size_t offset = 0)
      : std::runtime_error(message), offset_(offset) {}
  size_t offset() const { return offset_; }

private:
  size_t offset_;
};

class Value {
public:
  enum class Type { Null, Bool, Number, String, Array, Object };
  using Member = std::pair<std::string, Value>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : type_(Type::Bool), bool_(b) {}
  Value(int n) : type_(Type::Number), number_(n), integral_(true) {}
  Value(int64_t n)
      : type_(Type::Number), number_(static_cast<double>(n)), integral_(true) {}
  Value(double n) : type_(Type::Number), number_(n) {}
  Value(const char *s) : type_(Type::String), string_(s) {}
  Value(std::string s) : type_(Type::String), string_(std::move(s)) {}

  static Value array();
  static Value object();

  Type type() const { return type_; }
  bool is_null() const { return type_ == Type::Null; }
  bool is_bool() const { return type_ == Type::Bool; }
  bool is_number() const { return type_ == Type::Number; }
  bool is_integer() const { return type_ == Type::Number && integral_; }
  bool is_string() const { return type_ == Type::String; }
  bool is_array() const { return type_ == Type::Array; }
  bool is_object() const { return type_ == Type::Object; }

  // Accessors throw json::Error on a type mismatch.
  bool as_bool() const;
  int64_t as_int() const;
  double as_double() const;
  const std::string &as_string() const;

  // Arrays
  const std::vector<Value> &items() const;
  void push_back(Value v);

  // Objects keep insertion order.
  const std::vector<Member> &members() const;
  const Value *find(const std::string &key) const;
  bool contains(const std::string &key) const { return find(key) != nullptr; }
  const Value &at(const std::string &key) const;
  Value &operator[](const std::string &key);

  size_t size() const;

private:
  Type type_ = Type::Null;
  bool bool_ = false;
  double number_ = 0;
  bool integral_ = false;
  std::string string_;
  std::vector<Value> items_;
  std::vector<Member> members_;
};

Value parse(const std::string &text);

// indent < 0 produces a single line.
std::string dump(const Value &value, int indent = -1);

} // namespace json
} // namespace saveli
