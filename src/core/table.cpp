#include "tabjson/table.hpp"

namespace tj {

bool Table::add_column(Column c) {
  if (find(c.name())) return false;
  if (cols_.empty() && rows_ == 0) rows_ = c.size();
  if (c.size() != rows_) return false;
  cols_.push_back(std::move(c));
  return true;
}

bool Table::set_num_rows(std::size_t n) {
  if (!cols_.empty()) return n == rows_;
  rows_ = n;
  return true;
}

const Column* Table::find(std::string_view name) const {
  for (const auto& c : cols_) if (c.name() == name) return &c;
  return nullptr;
}

Schema Table::schema() const {
  Schema s;
  for (const auto& c : cols_) s.add(Field{c.name(), c.type(), c.nullable()});
  return s;
}

bool Table::append(const Table& other) {
  if (empty()) { *this = other; return true; }
  if (other.empty()) return true;
  if (other.cols_.size() != cols_.size()) return false;
  for (std::size_t i = 0; i < cols_.size(); ++i) {
    if (cols_[i].name() != other.cols_[i].name() || cols_[i].type() != other.cols_[i].type())
      return false;
  }
  for (std::size_t i = 0; i < cols_.size(); ++i) cols_[i].append_column(other.cols_[i]);
  rows_ += other.rows_;
  return true;
}

}
