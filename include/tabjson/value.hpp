#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tj {

// Column/value types. Nested holds the raw JSON text of an array or object.
enum class DataType : std::uint8_t { Null, Bool, Int, Float, String, Nested };

const char* type_name(DataType t) noexcept;

class Value {
public:
  Value() = default; // null

  static Value null() { return Value{}; }
  static Value boolean(bool b);
  static Value integer(std::int64_t i);
  static Value floating(double d);
  static Value string(std::string s);
  static Value nested(std::string raw_json);

  DataType type() const noexcept;
  bool is_null() const noexcept { return std::holds_alternative<std::monostate>(v_); }

  bool as_bool() const { return std::get<bool>(v_); }
  std::int64_t as_int() const { return std::get<std::int64_t>(v_); }
  double as_float() const { return std::get<double>(v_); }
  // String text, or the raw JSON of a Nested value.
  const std::string& as_string() const;

  // Text used when a column widens to String.
  std::string to_text() const;

  bool operator==(const Value& o) const { return v_ == o.v_; }
  bool operator!=(const Value& o) const { return !(*this == o); }

private:
  struct NestedJson {
    std::string text;
    bool operator==(const NestedJson& o) const { return text == o.text; }
  };
  using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, NestedJson>;
  Storage v_;
};

// Explicit conversion of `v` into a column of type `target`.
// Null passes through; equal types pass through; anything converts to String;
// Int converts to Float only when `promote_int_to_float` is set.
std::optional<Value> coerce(const Value& v, DataType target, bool promote_int_to_float);

// Shortest "%.{15,16,17}g" form that parses back to `x`; always contains
// '.' or an exponent so it reads back as a float.
std::string format_double(double x);

}
