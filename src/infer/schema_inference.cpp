#include "tabjson/schema_inference.hpp"

namespace tj {

SchemaInferencer::FieldState& SchemaInferencer::slot(const std::string& name) {
  auto it = index_.find(name);
  if (it != index_.end()) return fields_[it->second];
  index_.emplace(name, fields_.size());
  fields_.push_back(FieldState{name});
  return fields_.back();
}

void SchemaInferencer::observe(const Record& rec) {
  ++records_;
  for (const auto& [key, value] : rec) {
    FieldState& f = slot(key);
    ++f.present;
    if (value.is_null()) f.saw_null = true;
    else f.type = widen(f.type, value.type(), cfg_.promote_int_to_float);
  }
}

void SchemaInferencer::merge(const SchemaInferencer& other) {
  records_ += other.records_;
  for (const auto& o : other.fields_) {
    FieldState& f = slot(o.name);
    f.type = widen(f.type, o.type, cfg_.promote_int_to_float);
    f.saw_null = f.saw_null || o.saw_null;
    f.present += o.present;
  }
}

Schema SchemaInferencer::schema() const {
  Schema s;
  for (const auto& f : fields_) {
    const bool nullable = f.saw_null || f.present < records_;
    s.add(Field{f.name, f.type, nullable});
  }
  return s;
}

void SchemaInferencer::reset() {
  records_ = 0;
  fields_.clear();
  index_.clear();
}

}
