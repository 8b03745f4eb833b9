#pragma once
#include "tabjson/value.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tj {

struct Field {
  std::string name;
  DataType type = DataType::Null;
  bool nullable = false;

  bool operator==(const Field& o) const {
    return name == o.name && type == o.type && nullable == o.nullable;
  }
  bool operator!=(const Field& o) const { return !(*this == o); }
};

// Least upper bound on the type lattice:
//   Null <= every type; equal types stay; anything else meets at String.
// With `promote_int_to_float`, Int and Float meet at Float.
DataType widen(DataType a, DataType b, bool promote_int_to_float = false) noexcept;

// Ordered set of fields; each name appears once.
class Schema {
public:
  Schema() = default;

  // nullopt when a name appears twice.
  static std::optional<Schema> from_fields(std::vector<Field> fields);

  // Returns false (and leaves the schema unchanged) on a duplicate name.
  bool add(Field f);

  std::size_t size() const noexcept { return fields_.size(); }
  bool empty() const noexcept { return fields_.empty(); }
  const Field& field(std::size_t i) const { return fields_[i]; }
  Field& field(std::size_t i) { return fields_[i]; }
  const std::vector<Field>& fields() const noexcept { return fields_; }

  std::optional<std::size_t> index_of(std::string_view name) const;

  // Same names with the same type/nullability, ignoring column order.
  bool same_fields(const Schema& o) const;

  bool operator==(const Schema& o) const { return fields_ == o.fields_; }
  bool operator!=(const Schema& o) const { return !(*this == o); }

  // "{foo: int64, bar: str?}"
  std::string to_string() const;

private:
  std::vector<Field> fields_;
  std::unordered_map<std::string, std::size_t> index_;
};

}
