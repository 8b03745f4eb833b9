#include "tabjson/record.hpp"

namespace tj {

void Record::set(std::string key, Value v) {
  for (auto& e : entries_) {
    if (e.first == key) { e.second = std::move(v); return; }
  }
  entries_.emplace_back(std::move(key), std::move(v));
}

const Value* Record::find(std::string_view key) const {
  for (const auto& e : entries_) if (e.first == key) return &e.second;
  return nullptr;
}

}
