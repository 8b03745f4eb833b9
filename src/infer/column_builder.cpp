#include "tabjson/column_builder.hpp"

namespace tj {

ColumnBuilder::ColumnBuilder(Schema schema, Config cfg)
  : schema_(std::move(schema)), cfg_(cfg) {
  reset_columns();
}

void ColumnBuilder::reset_columns() {
  cols_.clear();
  cols_.reserve(schema_.size());
  for (const auto& f : schema_.fields()) cols_.emplace_back(f.name, f.type, f.nullable);
  rows_ = 0;
}

bool ColumnBuilder::append(const Record& rec) {
  err_.clear();
  const std::size_t n = schema_.size();
  staged_.assign(n, Value::null());
  seen_.assign(n, false);
  std::uint64_t dropped = 0, nulled = 0;

  for (const auto& [key, value] : rec) {
    auto idx = schema_.index_of(key);
    if (!idx) {
      if (cfg_.strict) {
        err_ = Error::make(ErrorKind::SchemaMismatch, "key \"" + key + "\" is not in the schema");
        return false;
      }
      ++dropped;
      continue;
    }
    seen_[*idx] = true;
    const Field& f = schema_.field(*idx);
    auto v = coerce(value, f.type, cfg_.promote_int_to_float);
    if (!v) {
      if (cfg_.strict) {
        err_ = Error::make(ErrorKind::SchemaMismatch,
                           "key \"" + key + "\": " + type_name(value.type()) +
                           " value does not fit column type " + type_name(f.type));
        return false;
      }
      ++nulled;
      continue; // staged stays null
    }
    staged_[*idx] = std::move(*v);
  }

  if (cfg_.strict) {
    for (std::size_t i = 0; i < n; ++i) {
      const Field& f = schema_.field(i);
      if (staged_[i].is_null() && !f.nullable) {
        err_ = Error::make(ErrorKind::SchemaMismatch,
                           "key \"" + f.name + "\" is " + (seen_[i] ? "null" : "missing") +
                           " but the column is not nullable");
        return false;
      }
    }
  }

  for (std::size_t i = 0; i < n; ++i) {
    if (staged_[i].is_null()) {
      cols_[i].append_null();
      cols_[i].set_nullable(true);
    } else {
      cols_[i].append(staged_[i]);
    }
  }
  ++rows_;
  dropped_fields_ += dropped;
  nulled_values_ += nulled;
  return true;
}

Table ColumnBuilder::finish() {
  Table t;
  t.set_num_rows(rows_);
  for (auto& c : cols_) t.add_column(std::move(c));
  reset_columns();
  return t;
}

}
