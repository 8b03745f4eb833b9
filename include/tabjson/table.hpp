#pragma once
#include "tabjson/column.hpp"
#include "tabjson/schema.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace tj {

// Ordered columns of equal length. A table may have rows but no columns
// (input made of empty objects), so the row count is kept separately.
class Table {
public:
  Table() = default;

  // False (table unchanged) if the length differs from num_rows() or the
  // name is already taken. The first column of an empty table sets num_rows().
  bool add_column(Column c);

  // Only for tables without columns.
  bool set_num_rows(std::size_t n);

  std::size_t num_rows() const noexcept { return rows_; }
  std::size_t num_columns() const noexcept { return cols_.size(); }
  bool empty() const noexcept { return rows_ == 0 && cols_.empty(); }

  const Column& column(std::size_t i) const { return cols_[i]; }
  const Column* find(std::string_view name) const;
  const std::vector<Column>& columns() const noexcept { return cols_; }

  Schema schema() const;
  Value at(std::size_t row, std::size_t col) const { return cols_[col].at(row); }

  // Vertical concatenation; column names and types must match in order.
  bool append(const Table& other);

  bool operator==(const Table& o) const { return rows_ == o.rows_ && cols_ == o.cols_; }
  bool operator!=(const Table& o) const { return !(*this == o); }

private:
  std::vector<Column> cols_;
  std::size_t rows_{0};
};

}
