#include "tabjson/column.hpp"

namespace tj {

Column::Column(std::string name, DataType type, bool nullable)
  : name_(std::move(name)), type_(type), nullable_(nullable || type == DataType::Null) {}

void Column::reserve(std::size_t n) {
  valid_.reserve(n);
  switch (type_) {
    case DataType::Bool:
    case DataType::Int:    ints_.reserve(n); break;
    case DataType::Float:  floats_.reserve(n); break;
    case DataType::String:
    case DataType::Nested: strings_.reserve(n); break;
    case DataType::Null:   break;
  }
}

void Column::append_null() {
  valid_.push_back(0);
  ++nulls_;
  switch (type_) {
    case DataType::Bool:
    case DataType::Int:    ints_.push_back(0); break;
    case DataType::Float:  floats_.push_back(0.0); break;
    case DataType::String:
    case DataType::Nested: strings_.emplace_back(); break;
    case DataType::Null:   break;
  }
}

bool Column::append(const Value& v) {
  if (v.is_null()) { append_null(); return true; }
  if (v.type() != type_) return false;
  switch (type_) {
    case DataType::Bool:   ints_.push_back(v.as_bool() ? 1 : 0); break;
    case DataType::Int:    ints_.push_back(v.as_int()); break;
    case DataType::Float:  floats_.push_back(v.as_float()); break;
    case DataType::String:
    case DataType::Nested: strings_.push_back(v.as_string()); break;
    case DataType::Null:   return false;
  }
  valid_.push_back(1);
  return true;
}

Value Column::at(std::size_t i) const {
  if (is_null(i)) return Value::null();
  switch (type_) {
    case DataType::Bool:   return Value::boolean(ints_[i] != 0);
    case DataType::Int:    return Value::integer(ints_[i]);
    case DataType::Float:  return Value::floating(floats_[i]);
    case DataType::String: return Value::string(strings_[i]);
    case DataType::Nested: return Value::nested(strings_[i]);
    case DataType::Null:   break;
  }
  return Value::null();
}

bool Column::append_column(const Column& other) {
  if (other.name_ != name_ || other.type_ != type_) return false;
  valid_.insert(valid_.end(), other.valid_.begin(), other.valid_.end());
  ints_.insert(ints_.end(), other.ints_.begin(), other.ints_.end());
  floats_.insert(floats_.end(), other.floats_.begin(), other.floats_.end());
  strings_.insert(strings_.end(), other.strings_.begin(), other.strings_.end());
  nulls_ += other.nulls_;
  nullable_ = nullable_ || other.nullable_;
  return true;
}

bool Column::operator==(const Column& o) const {
  if (name_ != o.name_ || type_ != o.type_ || size() != o.size()) return false;
  for (std::size_t i = 0; i < size(); ++i) {
    if (at(i) != o.at(i)) return false;
  }
  return true;
}

}
