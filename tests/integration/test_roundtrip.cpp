#include "tabjson/io.hpp"
#include "tabjson/path_utils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;
static void check(bool cond, const std::string& what) {
  if (cond) std::cout << "[PASS] " << what << "\n";
  else { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static bool read_any(const fs::path& p, tj::Table& out, tj::Error& err) {
  if (tj::detect_format(p.string()) == tj::FileFormat::JSON)
    return tj::read_json(p.string(), out, tj::JsonReader::Config{}, &err);
  return tj::read_ndjson(p.string(), out, tj::NdjsonReader::Config{}, &err);
}

static tj::Table built_table() {
  using tj::DataType;
  using tj::Value;
  tj::Column i("i", DataType::Int, true);
  tj::Column f("f", DataType::Float);
  tj::Column s("s", DataType::String);
  tj::Column z("z", DataType::Null);
  const double floats[] = {0.1, 1e-7, 123456789.125, -3.0};
  for (int r = 0; r < 4; ++r) {
    if (r == 2) i.append_null(); else i.append(Value::integer(r * 1000000007LL));
    f.append(Value::floating(floats[r]));
    s.append(Value::string(r % 2 ? "12" : "line\nbreak \xc3\xa9"));
    z.append_null();
  }
  tj::Table t;
  t.add_column(std::move(i));
  t.add_column(std::move(f));
  t.add_column(std::move(s));
  t.add_column(std::move(z));
  return t;
}

int main() {
  const fs::path tmp = fs::temp_directory_path() / "tabjson_roundtrip";
  fs::remove_all(tmp);
  fs::create_directories(tmp);

  // fixtures: read -> write both forms -> read back
  for (const char* name : {"path.json", "escapes.json", "pretty_nested.json", "simple.ndjson", "sparse.jsonl", "mixed.ndjson"}) {
    const fs::path in = fs::path("tests/data") / name;
    if (!fs::exists(in)) { std::cerr << "[ERR] missing: " << in << "\n"; return 2; }
    tj::Table t;
    tj::Error err;
    if (!read_any(in, t, err)) { check(false, std::string(name) + " read: " + err.to_string()); continue; }

    for (const char* ext : {".json", ".ndjson"}) {
      const fs::path out = tmp / (std::string(name) + ext);
      const bool wrote = (std::string(ext) == ".json") ? tj::write_json(t, out.string(), &err)
                                                       : tj::write_ndjson(t, out.string(), &err);
      tj::Table back;
      check(wrote && read_any(out, back, err) && back == t,
            std::string(name) + " round-trips through " + ext);
    }
  }

  // sparse input comes back dense
  {
    tj::Table t;
    tj::Error err;
    const fs::path out = tmp / "dense.ndjson";
    check(read_any("tests/data/sparse.jsonl", t, err) && tj::write_ndjson(t, out.string(), &err), "sparse rewrite");
    std::ifstream in(out);
    std::string line;
    int lines = 0;
    bool dense = true;
    while (std::getline(in, line)) {
      ++lines;
      for (const char* key : {"\"id\":", "\"name\":", "\"tags\":", "\"meta\":"})
        if (line.find(key) == std::string::npos) dense = false;
    }
    check(lines == 3 && dense, "every written row carries every key");
    check(t.schema().to_string() == "{id: int64, name: str?, tags: json?, meta: json?}",
          "sparse schema: " + t.schema().to_string());
  }

  // pretty-printed nested values stay on one NDJSON line
  {
    tj::Table t;
    tj::Error err;
    const fs::path out = tmp / "pretty.ndjson";
    check(read_any("tests/data/pretty_nested.json", t, err) && tj::write_ndjson(t, out.string(), &err),
          "pretty nested rewrite");
    std::ifstream in(out);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) lines.push_back(line);
    check(lines.size() == 2 &&
          lines[0] == R"({"id":1,"meta":{"k":true,"tags":["x","y"]}})" &&
          lines[1] == R"({"id":2,"meta":[1,2]})",
          "one record per line");
  }

  // widened columns read back as their widened type
  {
    tj::Table t;
    tj::Error err;
    check(read_any("tests/data/mixed.ndjson", t, err), "mixed read");
    check(t.schema().to_string() == "{v: str, w: str?}", "mixed schema: " + t.schema().to_string());
    check(t.at(0, 0) == tj::Value::string("1") && t.at(2, 0) == tj::Value::string("true") &&
          t.at(0, 1) == tj::Value::string("1.5") && t.at(1, 1) == tj::Value::string("2"),
          "widened values keep their JSON text");
  }

  // a table built in memory
  {
    const tj::Table t = built_table();
    for (const char* ext : {".json", ".ndjson"}) {
      const fs::path out = tmp / (std::string("built") + ext);
      tj::Error err;
      const bool wrote = (std::string(ext) == ".json") ? tj::write_json(t, out.string(), &err)
                                                       : tj::write_ndjson(t, out.string(), &err);
      tj::Table back;
      check(wrote && read_any(out, back, err) && back == t, std::string("built table round-trips through ") + ext);
    }
  }

  // shapes that do not survive: types come from values, so a column with
  // only nulls reads back as null, and a table with no rows has no columns
  {
    tj::Table t;
    tj::Column s("s", tj::DataType::String, true);
    s.append_null();
    s.append_null();
    t.add_column(std::move(s));
    const fs::path out = tmp / "all_null.ndjson";
    tj::Error err;
    tj::Table back;
    check(tj::write_ndjson(t, out.string(), &err) && read_any(out, back, err), "all-null column written");
    check(back.num_rows() == 2 && back.schema().to_string() == "{s: null?}" &&
          back.column(0).is_null(0) && back.column(0).is_null(1),
          "all-null column reads back as null: " + back.schema().to_string());
    check(!(back == t), "all-null column type is not kept");
  }
  for (const char* ext : {".json", ".ndjson"}) {
    tj::Table t;
    t.add_column(tj::Column("i", tj::DataType::Int));
    const fs::path out = tmp / (std::string("no_rows") + ext);
    tj::Error err;
    const bool wrote = (std::string(ext) == ".json") ? tj::write_json(t, out.string(), &err)
                                                     : tj::write_ndjson(t, out.string(), &err);
    tj::Table back;
    check(wrote && read_any(out, back, err), std::string("zero-row table written as ") + ext);
    check(back.num_rows() == 0 && back.num_columns() == 0,
          std::string("zero-row table reads back without columns from ") + ext);
  }

  fs::remove_all(tmp);
  std::cout << "\nSummary: failed=" << failures << "\n";
  return failures == 0 ? 0 : 1;
}
