#include "tabjson/schema.hpp"

namespace tj {

DataType widen(DataType a, DataType b, bool promote_int_to_float) noexcept {
  if (a == b) return a;
  if (a == DataType::Null) return b;
  if (b == DataType::Null) return a;
  if (promote_int_to_float &&
      ((a == DataType::Int && b == DataType::Float) ||
       (a == DataType::Float && b == DataType::Int)))
    return DataType::Float;
  return DataType::String;
}

std::optional<Schema> Schema::from_fields(std::vector<Field> fields) {
  Schema s;
  s.fields_.reserve(fields.size());
  for (auto& f : fields)
    if (!s.add(std::move(f))) return std::nullopt;
  return s;
}

bool Schema::add(Field f) {
  if (index_.count(f.name)) return false;
  index_.emplace(f.name, fields_.size());
  fields_.push_back(std::move(f));
  return true;
}

std::optional<std::size_t> Schema::index_of(std::string_view name) const {
  auto it = index_.find(std::string(name));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

bool Schema::same_fields(const Schema& o) const {
  if (size() != o.size()) return false;
  for (const auto& f : fields_) {
    auto j = o.index_of(f.name);
    if (!j || o.field(*j) != f) return false;
  }
  return true;
}

std::string Schema::to_string() const {
  std::string out = "{";
  for (std::size_t i = 0; i < fields_.size(); ++i) {
    if (i) out += ", ";
    out += fields_[i].name;
    out += ": ";
    out += type_name(fields_[i].type);
    if (fields_[i].nullable) out += '?';
  }
  out += '}';
  return out;
}

}
