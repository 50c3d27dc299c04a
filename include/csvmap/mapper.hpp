#pragma once
#include "csvmap/error.hpp"
#include "csvmap/field.hpp"
#include "csvmap/header_binder.hpp"
#include "csvmap/metrics.hpp"
#include "csvmap/parse_policy.hpp"
#include "csvmap/row_grid.hpp"
#include "csvmap/row_io.hpp"
#include "csvmap/schema.hpp"
#include "csvmap/value_coder.hpp"

#include <algorithm>
#include <cstddef>
#include <functional>
#include <iostream>
#include <limits>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace cm {

struct ReadOptions {
  SourceConfig source;
  ParsePolicy policy;
  unsigned decode_threads = 1;          // >1 splits data rows across threads
  MetricsRegistry* metrics = nullptr;
  std::ostream* log = &std::cerr;       // nullptr silences failure logging
};

struct WriteOptions {
  ParsePolicy policy;
  MetricsRegistry* metrics = nullptr;
  std::ostream* log = &std::cerr;
};

namespace detail {

// "[stage] <path>: <diagnostic>" on `log`, if any.
void log_error(std::ostream* log, std::string_view stage, std::string_view path, const Error& e);

inline constexpr std::size_t kNoRow = std::numeric_limits<std::size_t>::max();

// Returns the first failing data row of [begin, end), or kNoRow.
template <class T>
std::size_t decode_range(const RowGrid& grid, const Binding& binding, const RecordDescriptor<T>& desc,
                         const ParsePolicy& policy, std::vector<T>& recs,
                         std::size_t begin, std::size_t end, Error& err) {
  for (std::size_t i = begin; i < end; ++i) {
    if (!decode_row(binding, grid.data_view(i), desc, recs[i], &err, policy)) return i;
  }
  return kNoRow;
}

struct ThreadLauncher {
  std::thread operator()(std::function<void()> job) const { return std::thread(std::move(job)); }
};

// Joins every started worker, including on unwind.
class JoinAll {
public:
  explicit JoinAll(std::vector<std::thread>& pool) : pool_(pool) {}
  ~JoinAll() {
    for (auto& t : pool_) if (t.joinable()) t.join();
  }
  JoinAll(const JoinAll&) = delete;
  JoinAll& operator=(const JoinAll&) = delete;

private:
  std::vector<std::thread>& pool_;
};

// Decode all rows in `workers` contiguous slices. A slice whose thread
// cannot be started is decoded on the calling thread. Returns the lowest
// failing row (its error in `err`) or kNoRow.
template <class T, class Launch = ThreadLauncher>
std::size_t decode_slices(const RowGrid& grid, const Binding& binding, const RecordDescriptor<T>& desc,
                          const ParsePolicy& policy, std::vector<T>& recs, std::size_t workers,
                          Error& err, Launch launch = {}) {
  const std::size_t n = recs.size();
  std::vector<Error> errs(workers);
  std::vector<std::size_t> failed(workers, kNoRow);
  std::vector<std::thread> pool;
  pool.reserve(workers);
  {
    JoinAll joiner(pool);
    const std::size_t per = (n + workers - 1) / workers;
    for (std::size_t w = 0; w < workers; ++w) {
      const std::size_t begin = std::min(n, w * per);
      const std::size_t end = std::min(n, begin + per);
      auto job = [&, w, begin, end] {
        failed[w] = decode_range(grid, binding, desc, policy, recs, begin, end, errs[w]);
      };
      try {
        pool.push_back(launch(job));
      } catch (const std::system_error&) {
        job();
      }
    }
  }
  // Contiguous slices: the first failing slice holds the lowest failing row.
  for (std::size_t w = 0; w < workers; ++w) {
    if (failed[w] != kNoRow) {
      err = std::move(errs[w]);
      return failed[w];
    }
  }
  return kNoRow;
}

}

// Decode every data row of `grid` (row 0 is the header). `out` is replaced
// only when all rows decode.
template <class T>
bool decode_grid(const RowGrid& grid, std::vector<T>& out, Error* err = nullptr,
                 const ReadOptions& opts = {}) {
  Error e;
  auto report = [&](std::string_view stage) {
    if (opts.metrics && !e.field.empty()) opts.metrics->add_field_error(e.field);
    detail::log_error(opts.log, stage, {}, e);
    return fail(err, std::move(e));
  };

  if (grid.empty()) {
    e = source_error("missing header row");
    return report("read");
  }

  const auto& desc = descriptor_of<T>();
  Schema schema;
  Binding binding;
  {
    ScopedStage stage(opts.metrics, "bind");
    if (!resolve_schema(desc, schema, &e)) return report("bind");
    if (!bind_header(schema, grid.header(), binding, &e)) return report("bind");
  }

  ScopedStage stage(opts.metrics, "decode");
  const std::size_t n = grid.data_rows();
  std::vector<T> recs(n);
  const std::size_t workers = std::min<std::size_t>(std::max(1u, opts.decode_threads), std::max<std::size_t>(n, 1));
  const std::size_t bad = workers <= 1
      ? detail::decode_range(grid, binding, desc, opts.policy, recs, 0, n, e)
      : detail::decode_slices(grid, binding, desc, opts.policy, recs, workers, e);
  if (bad != detail::kNoRow) return report("decode");

  if (opts.metrics) opts.metrics->add_rows(n);
  out = std::move(recs);
  return true;
}

// Read `path` (CSV, or JSON Lines by extension) into typed records.
template <class T>
bool read_records(const std::string& path, std::vector<T>& out, Error* err = nullptr,
                  const ReadOptions& opts = {}) {
  RowGrid grid;
  {
    ScopedStage stage(opts.metrics, "read");
    Error e;
    if (!read_rows(path, grid, &e, opts.source)) {
      detail::log_error(opts.log, "read", path, e);
      return fail(err, std::move(e));
    }
  }
  if (opts.metrics) opts.metrics->add_bytes(grid.text_bytes());
  return decode_grid(grid, out, err, opts);
}

// Encode `records` into a grid: header in declaration order, then one row
// per record.
template <class T>
bool encode_grid(const std::vector<T>& records, RowGrid& out, Error* err = nullptr,
                 const WriteOptions& opts = {}) {
  const auto& desc = descriptor_of<T>();
  Schema schema;
  Error e;
  ScopedStage stage(opts.metrics, "encode");
  if (!resolve_schema(desc, schema, &e)) {
    detail::log_error(opts.log, "write", {}, e);
    return fail(err, std::move(e));
  }
  out = encode_records(schema, desc, records, opts.policy);
  if (opts.metrics) opts.metrics->add_rows(records.size());
  return true;
}

// Write `records` to `path` as CSV. Nothing is left at `path` on failure
// unless a previous file was already there.
template <class T>
bool write_records(const std::string& path, const std::vector<T>& records, Error* err = nullptr,
                   const WriteOptions& opts = {}) {
  RowGrid grid;
  if (!encode_grid(records, grid, err, opts)) return false;

  ScopedStage stage(opts.metrics, "write");
  Error e;
  if (!write_csv_rows(path, grid, &e)) {
    detail::log_error(opts.log, "write", path, e);
    return fail(err, std::move(e));
  }
  if (opts.metrics) opts.metrics->add_bytes(grid.text_bytes());
  return true;
}

}
