#pragma once
#include "tabjson/value.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tj {

// Typed column buffer with a validity mask. Bool and Int share the integer
// buffer; String and Nested share the string buffer.
class Column {
public:
  Column(std::string name, DataType type, bool nullable = false);

  const std::string& name() const noexcept { return name_; }
  DataType type() const noexcept { return type_; }
  bool nullable() const noexcept { return nullable_; }
  void set_nullable(bool v) noexcept { nullable_ = v; }

  std::size_t size() const noexcept { return valid_.size(); }
  std::size_t null_count() const noexcept { return nulls_; }
  void reserve(std::size_t n);

  // Appends a null or a value whose type equals type(); false otherwise.
  // Conversions happen before this call, see coerce().
  bool append(const Value& v);
  void append_null();

  bool is_null(std::size_t i) const { return valid_[i] == 0; }
  Value at(std::size_t i) const;

  // Concatenate `other` (same name and type) onto this column.
  bool append_column(const Column& other);

  // Names, types, null positions and values; the nullable flag is ignored.
  bool operator==(const Column& o) const;
  bool operator!=(const Column& o) const { return !(*this == o); }

private:
  std::string name_;
  DataType type_;
  bool nullable_;
  std::size_t nulls_{0};
  std::vector<std::uint8_t> valid_;
  std::vector<std::int64_t> ints_;
  std::vector<double> floats_;
  std::vector<std::string> strings_;
};

}
