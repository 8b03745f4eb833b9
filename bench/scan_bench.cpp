#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "tabjson/io.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_ndjson(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "tj_bench_synth.ndjson";
  std::ofstream out(p, std::ios::binary);
  for (size_t r = 0; r < rows; ++r) {
    out << "{";
    for (size_t c = 0; c < cols; ++c) {
      out << "\"k" << c << "\":";
      switch (c % 4) {
        case 0: out << r; break;
        case 1: out << (r%10) << "." << (c*37%1000); break;
        case 2: out << "\"s" << (r%97) << "\""; break;
        default: out << ((r%3) ? "true" : "null"); break;
      }
      if (c+1<cols) out << ",";
    }
    out << "}\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  std::size_t batch = 4096;
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--ndjson") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--batch") a.batch = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: scan_bench [--ndjson=path] [--rows=N] [--cols=M] [--batch=B] [--iters=K]\n"
        "If the path is omitted, synthetic NDJSON is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void report(const char* what, int k, std::uint64_t rows, std::uint64_t bytes, double sec) {
  const double mib = bytes / (1024.0*1024.0);
  std::cout << "  " << what << " iter " << k
            << ": rows=" << rows
            << " bytes=" << bytes
            << " time=" << sec << "s"
            << "  throughput=" << (mib/sec) << " MiB/s"
            << "  rows/s=" << (rows/sec) << "\n";
}

static void bench_read(const std::string& path, int iters) {
  std::cout << "\n[read] file=" << path << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    tj::Table t;
    tj::Error err;
    tj::ReadStats stats;
    auto t0 = clk::now();
    if (!tj::read_ndjson(path, t, tj::NdjsonReader::Config{}, &err, &stats)) {
      std::cerr << "[read] failed: " << err.to_string() << "\n";
      return;
    }
    auto t1 = clk::now();
    report("read", k, t.num_rows(), stats.bytes, std::chrono::duration<double>(t1-t0).count());
  }
}

static void bench_scan(const std::string& path, std::size_t batch, int iters) {
  std::cout << "\n[scan] file=" << path << " batch=" << batch << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    tj::NdjsonScanner::Config cfg;
    cfg.batch_size = batch;
    auto scanner = tj::scan_ndjson(path, cfg);
    tj::Table b;
    std::uint64_t nrec = 0;

    auto t0 = clk::now();
    tj::NdjsonScanner::Status st;
    while ((st = scanner.next_batch(b)) == tj::NdjsonScanner::Status::Batch) nrec += b.num_rows();
    auto t1 = clk::now();
    if (st == tj::NdjsonScanner::Status::Error) {
      std::cerr << "[scan] failed: " << scanner.error().to_string() << "\n";
      return;
    }
    report("scan", k, nrec, scanner.stats().bytes, std::chrono::duration<double>(t1-t0).count());
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth_ndjson(a.rows, a.cols);
  bench_read(path, a.iters);
  bench_scan(path, a.batch, a.iters);
  return 0;
}
