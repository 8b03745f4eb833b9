#include "tabjson/metrics.hpp"
#include <chrono>

namespace tj {

void MetricsRegistry::reset() {
  rows_ = bytes_ = batches_ = skipped_ = 0;
  kind_errs_.clear();
  stage_order_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  auto key = std::string(name);
  if (stage_accum_ms_.emplace(key, 0.0).second) stage_order_.push_back(key);
  stage_starts_[key] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  stage_accum_ms_[key] += std::chrono::duration<double, std::milli>(
                            std::chrono::steady_clock::now() - it->second).count();
  stage_starts_.erase(it);
}

void MetricsRegistry::add_error(ErrorKind kind, std::uint64_t n) {
  if (kind == ErrorKind::None || n == 0) return;
  kind_errs_[error_kind_name(kind)] += n;
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows = rows_;
  r.bytes = bytes_;
  r.batches = batches_;
  r.skipped_lines = skipped_;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  r.rows_per_sec = (sec > 0.0) ? rows_ / sec : 0.0;

  r.errors_by_kind = kind_errs_;
  r.stages.reserve(stage_order_.size());
  for (auto& name : stage_order_) r.stages.push_back(StageTiming{name, stage_accum_ms_.at(name)});
  return r;
}

}
