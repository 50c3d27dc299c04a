#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "fast_float/fast_float.h"
#include "csvmap/mapper.hpp"

using clk = std::chrono::steady_clock;

struct Trade {
  std::string symbol;
  bool buy = false;
  int qty = 0;
  long long id = 0;
  double price = 0.0;
};

namespace cm {
template <> struct RecordTraits<Trade> {
  static RecordDescriptor<Trade> describe() {
    return {
      field("Symbol", &Trade::symbol, "symbol"),
      field("Buy",    &Trade::buy,    "buy"),
      field("Qty",    &Trade::qty,    "qty"),
      field("Id",     &Trade::id,     "id"),
      field("Price",  &Trade::price,  "price"),
    };
  }
};
}

static cm::RowGrid make_grid(size_t n) {
  cm::RowGrid g(1 << 20);
  g.add_row({"id", "price", "symbol", "qty", "buy", "note"});
  std::mt19937_64 rng(12345);
  std::uniform_real_distribution<double> d(-1e6, 1e6);
  std::uniform_int_distribution<int> q(1, 100000);
  for (size_t i=0;i<n;++i) {
    char price[64];
    std::snprintf(price, sizeof(price), "%.6f", d(rng));
    g.add_row(std::vector<std::string>{std::to_string(i), price, "SYM" + std::to_string(i % 500),
                                       std::to_string(q(rng)), (i & 1) ? "true" : "F", "-"});
  }
  return g;
}

static void bench_fast_float(const cm::RowGrid& g, int iters) {
  std::cout << "\n[fast_float] cells=" << g.data_rows() << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    std::size_t ok=0;
    auto t0 = clk::now();
    for (size_t i=1;i<g.size();++i) {
      std::string_view s = g[i][1];
      double out;
      auto [ptr, ec] = fast_float::from_chars(s.data(), s.data()+s.size(), out);
      if (ec == std::errc()) ++ok;
    }
    auto t1 = clk::now();
    double sec = std::chrono::duration<double>(t1-t0).count();
    std::cout << "  iter " << k << ": ok=" << ok
              << " time=" << sec << "s  rate=" << (g.data_rows()/sec)/1e6 << " M/s\n";
  }
}

static void bench_decode(const cm::RowGrid& g, int iters, unsigned threads) {
  std::cout << "\n[decode] rows=" << g.data_rows() << " threads=" << threads << " iters=" << iters << "\n";
  cm::ReadOptions opts;
  opts.decode_threads = threads;
  for (int k=1;k<=iters;++k) {
    cm::MetricsRegistry m;
    opts.metrics = &m;
    std::vector<Trade> out;
    cm::Error err;
    auto t0 = clk::now();
    bool ok = cm::decode_grid(g, out, &err, opts);
    auto t1 = clk::now();
    if (!ok) { std::cerr << "[bench] decode failed: " << err.describe() << "\n"; return; }
    double ms = std::chrono::duration<double, std::milli>(t1-t0).count();
    cm::RunStats s = m.snapshot(ms);
    std::cout << "  iter " << k << ": rows=" << s.rows
              << " time=" << ms << "ms  rate=" << (s.rows/ms)/1e3 << " M rows/s\n";
  }
}

int main(int argc, char** argv) {
  size_t n = (argc > 1) ? std::strtoull(argv[1], nullptr, 10) : 500000;
  int iters = (argc > 2) ? std::atoi(argv[2]) : 3;
  unsigned threads = (argc > 3) ? static_cast<unsigned>(std::atoi(argv[3])) : 4;

  auto g = make_grid(n);
  std::cout << "[bench] text=" << g.text_bytes() << " bytes\n";
  bench_fast_float(g, iters);
  bench_decode(g, iters, 1);
  if (threads > 1) bench_decode(g, iters, threads);
  return 0;
}
