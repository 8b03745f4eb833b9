#include "tabjson/io.hpp"
#include "tabjson/metrics.hpp"
#include "tabjson/path_utils.hpp"
#include "tabjson/run_report.hpp"

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 2; // bad flags, unreadable input, unwritable report
constexpr int kExitRead = 3;
constexpr int kExitWrite = 4;

struct Cli {
  std::string in;
  std::string in_format;  // json|ndjson, empty -> from extension
  std::string out;
  std::string out_format; // json|ndjson, empty -> from extension
  std::string report;
  bool scan = false;
  std::size_t batch_size = 1024;
  std::string schema_mode = "sample"; // sample|full
  std::optional<std::size_t> infer_rows;
  std::optional<std::uint64_t> n_rows;
  bool strict = false;
  std::string on_error = "fail"; // fail|skip; --skip-bad-lines means skip
  std::string big_int = "fail"; // fail|float
  bool promote_numeric = false;
};

void usage(std::ostream& o) {
  o <<
    "Usage: tabjson --in=<file> [--in-format=json|ndjson] [--out=<file>]\n"
    "               [--out-format=json|ndjson] [--scan] [--batch-size=N]\n"
    "               [--schema-mode=sample|full] [--infer-rows=N] [--n-rows=N]\n"
    "               [--strict] [--on-error=fail|skip] [--skip-bad-lines]\n"
    "               [--big-int=fail|float] [--promote-numeric] [--report=<file>]\n";
}

template <typename T>
bool parse_uint(std::string_view s, T* out) {
  T v{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr != s.data() + s.size()) return false;
  *out = v;
  return true;
}

// Returns false on an unknown flag or a bad number.
bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto value_of = [&](const char* pfx, std::string_view* out){
      if (a.rfind(pfx, 0) != 0) return false;
      *out = std::string_view(a).substr(std::string_view(pfx).size());
      return true;
    };
    std::string_view num;

    if (eat("--in=", &c.in)) continue;
    if (eat("--in-format=", &c.in_format)) continue;
    if (eat("--out=", &c.out)) continue;
    if (eat("--out-format=", &c.out_format)) continue;
    if (eat("--report=", &c.report)) continue;
    if (eat("--schema-mode=", &c.schema_mode)) continue;
    if (eat("--big-int=", &c.big_int)) continue;
    if (eat("--on-error=", &c.on_error)) continue;
    if (value_of("--batch-size=", &num)) {
      if (!parse_uint(num, &c.batch_size) || c.batch_size == 0) {
        std::cerr << "[cli] bad --batch-size: " << num << "\n";
        return false;
      }
      continue;
    }
    if (value_of("--infer-rows=", &num)) {
      std::size_t v = 0;
      if (!parse_uint(num, &v)) { std::cerr << "[cli] bad --infer-rows: " << num << "\n"; return false; }
      c.infer_rows = v;
      continue;
    }
    if (value_of("--n-rows=", &num)) {
      std::uint64_t v = 0;
      if (!parse_uint(num, &v)) { std::cerr << "[cli] bad --n-rows: " << num << "\n"; return false; }
      c.n_rows = v;
      continue;
    }
    if (a == "--scan")            { c.scan = true; continue; }
    if (a == "--strict")          { c.strict = true; continue; }
    if (a == "--skip-bad-lines")  { c.on_error = "skip"; continue; }
    if (a == "--promote-numeric") { c.promote_numeric = true; continue; }
    if (a == "-h" || a == "--help") {
      usage(std::cout);
      std::exit(kExitOk);
    }
    std::cerr << "[cli] unknown argument: " << a << "\n";
    return false;
  }
  if (c.in.empty()) {
    std::cerr << "[cli] --in is required\n";
    return false;
  }
  return true;
}

std::optional<tj::FileFormat> resolve_format(const std::string& flag, const std::string& path) {
  if (!flag.empty()) {
    auto f = tj::json_format_from(flag);
    if (!f) return std::nullopt;
    return *f == tj::JsonFormat::Array ? tj::FileFormat::JSON : tj::FileFormat::NDJSON;
  }
  auto f = tj::detect_format(path);
  if (f == tj::FileFormat::Unknown) return std::nullopt;
  return f;
}

tj::JsonFormat writer_format(tj::FileFormat f) {
  return f == tj::FileFormat::NDJSON ? tj::JsonFormat::Lines : tj::JsonFormat::Array;
}

// The exit code a failed read maps to.
int read_exit(const tj::Error& e) {
  return e.kind == tj::ErrorKind::IOFailure ? kExitUsage : kExitRead;
}

void note_read_stats(const tj::ReadStats& s, tj::MetricsRegistry& m, tj::RunReport& rep) {
  m.add_bytes(s.bytes);
  m.add_skipped(s.skipped_lines);
  for (const auto& [kind, n] : s.skipped_by_kind) m.add_error(kind, n);
  for (const auto& e : s.errors) rep.error_samples.push_back(e.to_string());
  if (s.dropped_fields || s.nulled_values) {
    std::cout << "[read] relaxed: dropped_fields=" << s.dropped_fields
              << " nulled_values=" << s.nulled_values << "\n";
  }
}

int run_eager(const Cli& cli, const tj::ReadOptions& ro, tj::FileFormat in_fmt,
              std::optional<tj::FileFormat> out_fmt,
              tj::MetricsRegistry& m, tj::RunReport& rep) {
  tj::Table table;
  tj::Error err;
  tj::ReadStats stats;

  m.start_stage("read");
  bool ok = false;
  if (in_fmt == tj::FileFormat::JSON) {
    tj::JsonReader r(tj::JsonReader::Config{ro, cli.infer_rows});
    ok = r.read_file(cli.in, table);
    err = r.error();
    stats = r.stats();
  } else {
    tj::NdjsonReader r(tj::NdjsonReader::Config{ro, cli.infer_rows});
    ok = r.read_file(cli.in, table);
    err = r.error();
    stats = r.stats();
  }
  m.end_stage("read");
  note_read_stats(stats, m, rep);

  if (!ok) {
    m.add_error(err.kind);
    rep.ok = false;
    rep.error = err.to_string();
    std::cerr << "[read] failed: " << cli.in << ": " << err.to_string() << "\n";
    return read_exit(err);
  }
  m.add_rows(table.num_rows());
  rep.schema = table.schema();
  std::cout << "[read] ok: " << cli.in << " rows=" << table.num_rows()
            << " schema=" << rep.schema.to_string();
  if (stats.skipped_lines) std::cout << " skipped=" << stats.skipped_lines;
  std::cout << "\n";

  if (!out_fmt) return kExitOk;

  m.start_stage("write");
  tj::TableWriter::Config wcfg;
  wcfg.format = writer_format(*out_fmt);
  tj::TableWriter w(wcfg);
  ok = w.write_file(table, cli.out);
  m.end_stage("write");
  if (!ok) {
    m.add_error(w.error().kind);
    rep.ok = false;
    rep.error = w.error().to_string();
    std::cerr << "[write] failed: " << w.error().to_string() << "\n";
    return kExitWrite;
  }
  std::cout << "[write] ok: " << cli.out << " bytes=" << w.bytes_written() << "\n";
  return kExitOk;
}

int run_scan(const Cli& cli, const tj::ReadOptions& ro,
             std::optional<tj::FileFormat> out_fmt,
             tj::MetricsRegistry& m, tj::RunReport& rep) {
  tj::NdjsonScanner::Config scfg;
  scfg.read = ro;
  scfg.batch_size = cli.batch_size;
  scfg.schema_mode = (cli.schema_mode == "full") ? tj::NdjsonScanner::SchemaMode::FullScan
                                                 : tj::NdjsonScanner::SchemaMode::Sample;
  if (cli.infer_rows) scfg.sample_rows = *cli.infer_rows;
  tj::NdjsonScanner scanner = tj::scan_ndjson(cli.in, scfg);

  // Lines output streams batch by batch; array output needs the whole table.
  std::ofstream lines_out;
  tj::Table collected;
  tj::TableWriter::Config wcfg;
  if (out_fmt) wcfg.format = writer_format(*out_fmt);
  tj::TableWriter w(wcfg);
  std::uint64_t written = 0;
  const bool streaming = out_fmt && wcfg.format == tj::JsonFormat::Lines;

  auto write_failed = [&](const tj::Error& e) {
    m.add_error(e.kind);
    rep.ok = false;
    rep.error = e.to_string();
    std::cerr << "[write] failed: " << e.to_string() << "\n";
    if (lines_out.is_open()) {
      lines_out.close();
      std::error_code ec;
      std::filesystem::remove(cli.out, ec);
    }
    return kExitWrite;
  };

  if (streaming) {
    if (!tj::ensure_parent_dirs(cli.out)) {
      return write_failed(tj::Error::make(tj::ErrorKind::IOFailure, "cannot create parent directories of " + cli.out));
    }
    lines_out.open(cli.out, std::ios::binary | std::ios::trunc);
    if (!lines_out) {
      return write_failed(tj::Error::make(tj::ErrorKind::IOFailure, "cannot open " + cli.out + " for writing"));
    }
  }

  m.start_stage("scan");
  tj::Table batch;
  tj::NdjsonScanner::Status st;
  while ((st = scanner.next_batch(batch)) == tj::NdjsonScanner::Status::Batch) {
    m.add_batch();
    m.add_rows(batch.num_rows());
    if (streaming) {
      m.start_stage("write");
      const bool ok = w.write(batch, lines_out);
      m.end_stage("write");
      if (!ok) { m.end_stage("scan"); return write_failed(w.error()); }
      written += w.bytes_written();
    } else if (out_fmt && !collected.append(batch)) {
      m.end_stage("scan");
      return write_failed(tj::Error::make(tj::ErrorKind::SchemaMismatch, "batch columns differ from earlier batches"));
    }
  }
  m.end_stage("scan");
  note_read_stats(scanner.stats(), m, rep);
  rep.schema = scanner.schema();

  if (st == tj::NdjsonScanner::Status::Error) {
    const tj::Error& err = scanner.error();
    m.add_error(err.kind);
    rep.ok = false;
    rep.error = err.to_string();
    std::cerr << "[scan] failed: " << cli.in << ": " << err.to_string() << "\n";
    if (lines_out.is_open()) {
      lines_out.close();
      std::error_code ec;
      std::filesystem::remove(cli.out, ec);
    }
    return read_exit(err);
  }
  std::cout << "[scan] ok: " << cli.in << " rows=" << scanner.stats().rows
            << " schema=" << rep.schema.to_string() << "\n";

  if (streaming) {
    lines_out.close();
    if (!lines_out) {
      return write_failed(tj::Error::make(tj::ErrorKind::IOFailure, "close of " + cli.out + " failed"));
    }
  } else if (out_fmt) {
    m.start_stage("write");
    const bool ok = w.write_file(collected, cli.out);
    m.end_stage("write");
    if (!ok) return write_failed(w.error());
    written = w.bytes_written();
  }
  if (out_fmt) std::cout << "[write] ok: " << cli.out << " bytes=" << written << "\n";
  return kExitOk;
}

bool write_report(const std::string& path, const tj::RunReport& rep) {
  if (!tj::ensure_parent_dirs(path)) return false;
  std::ofstream o(path, std::ios::binary | std::ios::trunc);
  if (!o) return false;
  o << tj::RunReportWriter::to_json(rep) << "\n";
  o.close();
  return static_cast<bool>(o);
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) {
    usage(std::cerr);
    return kExitUsage;
  }

  auto in_fmt = resolve_format(cli.in_format, cli.in);
  if (!in_fmt) {
    std::cerr << "[cli] cannot tell input format of " << cli.in << "; pass --in-format\n";
    return kExitUsage;
  }
  std::optional<tj::FileFormat> out_fmt;
  if (!cli.out.empty()) {
    out_fmt = resolve_format(cli.out_format, cli.out);
    if (!out_fmt) {
      std::cerr << "[cli] cannot tell output format of " << cli.out << "; pass --out-format\n";
      return kExitUsage;
    }
  }
  if (cli.scan && *in_fmt != tj::FileFormat::NDJSON) {
    std::cerr << "[cli] --scan needs newline-delimited input\n";
    return kExitUsage;
  }
  if (cli.schema_mode != "sample" && cli.schema_mode != "full") {
    std::cerr << "[cli] bad --schema-mode: " << cli.schema_mode << "\n";
    return kExitUsage;
  }
  auto big_int = tj::ParsePolicy::big_int_from(cli.big_int);
  if (!big_int) {
    std::cerr << "[cli] bad --big-int: " << cli.big_int << "\n";
    return kExitUsage;
  }

  auto on_error = tj::ParsePolicy::on_error_from(cli.on_error);
  if (!on_error) {
    std::cerr << "[cli] bad --on-error: " << cli.on_error << "\n";
    return kExitUsage;
  }

  tj::ReadOptions ro;
  ro.policy.big_int = *big_int;
  ro.policy.on_error = *on_error;
  ro.strict = cli.strict;
  ro.promote_int_to_float = cli.promote_numeric;
  ro.n_rows = cli.n_rows;

  tj::RunReport rep;
  rep.mode = cli.scan ? "scan" : "read";
  rep.input = cli.in;
  rep.input_format = tj::format_name(*in_fmt);
  rep.content_type = tj::content_type(*in_fmt);
  rep.output = cli.out;
  rep.output_format = out_fmt ? tj::format_name(*out_fmt) : "";
  std::error_code fec;
  const auto size = std::filesystem::file_size(cli.in, fec);
  rep.input_size = fec ? 0 : static_cast<std::uint64_t>(size);

  namespace ch = std::chrono;
  tj::MetricsRegistry metrics;
  const auto t0 = ch::steady_clock::now();
  const int rc = cli.scan ? run_scan(cli, ro, out_fmt, metrics, rep)
                          : run_eager(cli, ro, *in_fmt, out_fmt, metrics, rep);
  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  rep.fill_from(metrics.snapshot(wall_ms), wall_ms);

  if (!cli.report.empty()) {
    if (!write_report(cli.report, rep)) {
      std::cerr << "[report] cannot write " << cli.report << "\n";
      return rc != kExitOk ? rc : kExitUsage;
    }
    std::cout << "[report] " << cli.report << "\n";
  }
  return rc;
}
