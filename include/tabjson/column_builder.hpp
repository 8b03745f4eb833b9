#pragma once
#include "tabjson/column.hpp"
#include "tabjson/error.hpp"
#include "tabjson/record.hpp"
#include "tabjson/schema.hpp"
#include "tabjson/table.hpp"
#include <cstdint>
#include <vector>

namespace tj {

// Appends records into per-column buffers laid out by a fixed schema.
class ColumnBuilder {
public:
  struct Config {
    bool strict = false;               // unknown keys / type conflicts -> SchemaMismatch
    bool promote_int_to_float = false; // must match the inferencer's setting
  };

  ColumnBuilder(Schema schema, Config cfg);

  // All-or-nothing: on failure no column grows and error() is set.
  bool append(const Record& rec);

  // Moves the accumulated rows out; the builder is empty afterwards.
  Table finish();

  std::uint64_t rows() const noexcept { return rows_; }
  std::uint64_t dropped_fields() const noexcept { return dropped_fields_; } // keys not in schema
  std::uint64_t nulled_values() const noexcept { return nulled_values_; }   // values the column type cannot hold
  const Schema& schema() const noexcept { return schema_; }
  const Error& error() const noexcept { return err_; }

private:
  void reset_columns();

  Schema schema_;
  Config cfg_;
  std::vector<Column> cols_;
  std::vector<Value> staged_;
  std::vector<bool> seen_;
  std::uint64_t rows_{0};
  std::uint64_t dropped_fields_{0};
  std::uint64_t nulled_values_{0};
  Error err_;
};

}
