#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cm {

struct StageTiming {
  std::string name;
  std::uint64_t duration_us = 0;
};

struct RunStats {
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_field;
};

// Caller-owned counters for read/write calls. Not synchronized.
class MetricsRegistry {
public:
  void reset();
  void add_rows(std::uint64_t n) noexcept { rows_ += n; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_field_error(std::string_view field);

  std::uint64_t rows() const noexcept { return rows_; }
  std::uint64_t bytes() const noexcept { return bytes_; }
  std::uint64_t field_errors(std::string_view field) const;
  bool has_stage(std::string_view name) const;

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::unordered_map<std::string, std::uint64_t> field_errs_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_us_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Times one stage on an optional registry.
class ScopedStage {
public:
  ScopedStage(MetricsRegistry* m, std::string_view name) : m_(m), name_(name) {
    if (m_) m_->start_stage(name_);
  }
  ~ScopedStage() { if (m_) m_->end_stage(name_); }

  ScopedStage(const ScopedStage&) = delete;
  ScopedStage& operator=(const ScopedStage&) = delete;

private:
  MetricsRegistry* m_;
  std::string_view name_;
};

}
