#include "tabjson/column_builder.hpp"
#include "tabjson/read_options.hpp"
#include "tabjson/schema_inference.hpp"
#include <algorithm>

namespace tj {

bool records_to_table(const std::vector<Record>& records,
                      const std::vector<RecordPos>* positions,
                      const ReadOptions& opts,
                      std::optional<std::size_t> infer_schema_length,
                      Table& out, ReadStats& stats, Error& err) {
  Schema schema;
  if (opts.schema) {
    schema = *opts.schema;
  } else {
    SchemaInferencer inf(SchemaInferencer::Config{opts.promote_int_to_float});
    const std::size_t limit = infer_schema_length
        ? std::min(*infer_schema_length, records.size())
        : records.size();
    for (std::size_t i = 0; i < limit; ++i) inf.observe(records[i]);
    schema = inf.schema();
  }

  ColumnBuilder builder(std::move(schema),
                        ColumnBuilder::Config{opts.strict, opts.promote_int_to_float});
  for (std::size_t i = 0; i < records.size(); ++i) {
    if (!builder.append(records[i])) {
      err = builder.error();
      if (positions && i < positions->size()) {
        err.line = (*positions)[i].line;
        err.byte_offset = (*positions)[i].offset;
      }
      return false;
    }
  }
  stats.rows = builder.rows();
  stats.dropped_fields += builder.dropped_fields();
  stats.nulled_values += builder.nulled_values();
  out = builder.finish();
  return true;
}

}
