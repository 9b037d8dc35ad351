#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace granddao::json {

struct Value;
using Array = std::vector<Value>;
// Ordered so that stringify() output is stable without a separate key sort.
using Object = std::map<std::string, Value>;

// Minimal JSON value type (null, bool, number, string, array, object).
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const bool* as_bool() const;
  const double* as_number() const;
  const std::string* as_string() const;
  const Array* as_array() const;
  const Object* as_object() const;

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;
  const Value& at(std::size_t index) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw std::runtime_error on wrong type.
  const Object& object() const;
  const Array& array() const;
};

// Returns nullptr when the key is absent.
const Value* find(const Object& o, const std::string& key);

// Parse a JSON document. Throws std::runtime_error with line/column on failure.
Value parse(const std::string& text);

// Convert a JSON value to text. indent <= 0 produces compact output.
std::string stringify(const Value& v, int indent = 2);

Value object(Object o);
Value array(Array a);

} // namespace granddao::json
