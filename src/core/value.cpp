#include "tabjson/value.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace tj {

const char* type_name(DataType t) noexcept {
  switch (t) {
    case DataType::Null:   return "null";
    case DataType::Bool:   return "bool";
    case DataType::Int:    return "int64";
    case DataType::Float:  return "float64";
    case DataType::String: return "str";
    case DataType::Nested: return "json";
  }
  return "unknown";
}

Value Value::boolean(bool b)          { Value v; v.v_ = b; return v; }
Value Value::integer(std::int64_t i)  { Value v; v.v_ = i; return v; }
Value Value::floating(double d)       { Value v; v.v_ = d; return v; }
Value Value::string(std::string s)    { Value v; v.v_ = std::move(s); return v; }
Value Value::nested(std::string raw)  { Value v; v.v_ = NestedJson{std::move(raw)}; return v; }

DataType Value::type() const noexcept {
  switch (v_.index()) {
    case 1: return DataType::Bool;
    case 2: return DataType::Int;
    case 3: return DataType::Float;
    case 4: return DataType::String;
    case 5: return DataType::Nested;
    default: return DataType::Null;
  }
}

const std::string& Value::as_string() const {
  if (auto* n = std::get_if<NestedJson>(&v_)) return n->text;
  return std::get<std::string>(v_);
}

std::string Value::to_text() const {
  switch (type()) {
    case DataType::Null:   return "null";
    case DataType::Bool:   return as_bool() ? "true" : "false";
    case DataType::Int:    return std::to_string(as_int());
    case DataType::Float:  return format_double(as_float());
    case DataType::String:
    case DataType::Nested: return as_string();
  }
  return {};
}

std::optional<Value> coerce(const Value& v, DataType target, bool promote_int_to_float) {
  const DataType t = v.type();
  if (t == DataType::Null || t == target) return v;
  if (target == DataType::String) return Value::string(v.to_text());
  if (target == DataType::Float && t == DataType::Int && promote_int_to_float)
    return Value::floating(static_cast<double>(v.as_int()));
  return std::nullopt;
}

std::string format_double(double x) {
  char tmp[64];
  int n = 0;
  for (int prec = 15; prec <= 17; ++prec) {
    n = std::snprintf(tmp, sizeof(tmp), "%.*g", prec, x);
    if (!std::isfinite(x) || std::strtod(tmp, nullptr) == x) break;
  }
  std::string out(tmp, (n > 0) ? static_cast<size_t>(n) : 0);
  if (std::isfinite(x) && out.find_first_of(".eE") == std::string::npos) out += ".0";
  return out;
}

}
