#pragma once
#include "tabjson/error.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tj {

struct StageTiming {
  std::string name;
  double duration_ms = 0.0;
};

struct RunStats {
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  std::uint64_t batches = 0;
  std::uint64_t skipped_lines = 0;
  double throughput_mb_s = 0.0;
  double rows_per_sec = 0.0;

  std::vector<StageTiming> stages; // in first-start order
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

// Stage names used by the executable: read (parse, infer and build), write, scan.
class MetricsRegistry {
public:
  void reset();
  void add_rows(std::uint64_t n) noexcept { rows_ += n; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_batch() noexcept { ++batches_; }
  void add_skipped(std::uint64_t n) noexcept { skipped_ += n; }

  // Repeated start/end pairs for one name accumulate.
  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_error(ErrorKind kind, std::uint64_t n = 1);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::uint64_t batches_{0};
  std::uint64_t skipped_{0};
  std::unordered_map<std::string, std::uint64_t> kind_errs_;
  std::vector<std::string> stage_order_;
  std::unordered_map<std::string, double> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
