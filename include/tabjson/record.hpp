#pragma once
#include "tabjson/value.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tj {

// One decoded input unit: field name -> value, in document order.
// Records are short-lived; the inferencer and builder copy what they keep.
class Record {
public:
  using Entry = std::pair<std::string, Value>;

  void clear() noexcept { entries_.clear(); }
  void reserve(std::size_t n) { entries_.reserve(n); }

  // A repeated key keeps its first position and takes the last value.
  void set(std::string key, Value v);

  const Value* find(std::string_view key) const;

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  const Entry& at(std::size_t i) const { return entries_[i]; }

  std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
  std::vector<Entry>::const_iterator end() const { return entries_.end(); }

private:
  std::vector<Entry> entries_;
};

}
