#pragma once
#include "tabjson/record.hpp"
#include "tabjson/schema.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tj {

// Accumulates key sets and value types over records. The resulting schema
// depends only on the multiset of records seen: observe() order and merge()
// grouping change column order at most.
class SchemaInferencer {
public:
  struct Config {
    bool promote_int_to_float = false; // Int + Float -> Float instead of String
  };

  SchemaInferencer() : SchemaInferencer(Config{}) {}
  explicit SchemaInferencer(Config cfg) : cfg_(cfg) {}

  void observe(const Record& rec);

  // Fold another inferencer (e.g. from a different batch or thread) into this one.
  void merge(const SchemaInferencer& other);

  Schema schema() const;

  std::uint64_t records_seen() const noexcept { return records_; }
  void reset();

private:
  struct FieldState {
    std::string name;
    DataType type = DataType::Null;
    bool saw_null = false;
    std::uint64_t present = 0; // records carrying this key
  };

  FieldState& slot(const std::string& name);

  Config cfg_;
  std::uint64_t records_{0};
  std::vector<FieldState> fields_;
  std::unordered_map<std::string, std::size_t> index_;
};

}
