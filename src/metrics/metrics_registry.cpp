#include "csvmap/metrics.hpp"
#include <chrono>

namespace cm {

void MetricsRegistry::reset() {
  rows_ = bytes_ = 0;
  field_errs_.clear();
  stage_accum_us_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto us = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_us_[key] += static_cast<std::uint64_t>(us);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_field_error(std::string_view field) {
  ++field_errs_[std::string(field)];
}

std::uint64_t MetricsRegistry::field_errors(std::string_view field) const {
  auto it = field_errs_.find(std::string(field));
  return it == field_errs_.end() ? 0 : it->second;
}

bool MetricsRegistry::has_stage(std::string_view name) const {
  return stage_accum_us_.count(std::string(name)) != 0;
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.rows = rows_;
  r.bytes = bytes_;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;

  r.errors_by_field = field_errs_;
  r.stages.reserve(stage_accum_us_.size());
  for (auto& kv : stage_accum_us_) r.stages.push_back(StageTiming{kv.first, kv.second});
  return r;
}

}
