#include "csvmap/token_csv_fsm.hpp"
#include "csvmap/chunk_reader.hpp"
#include "../test_support.hpp"
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using Rows = std::vector<std::vector<std::string>>;

static bool feed_all(cm::CsvFsm& csv, const std::vector<std::string>& lines, Rows& out) {
  auto on_row = [&](const cm::Row& row){ out.emplace_back(row.begin(), row.end()); };
  for (const auto& l : lines) if (!csv.feed(l, on_row)) return false;
  return csv.finish(on_row);
}

int main(){
  const fs::path f = "tests/data/edge_quotes.csv";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  cm::CsvFsm csv;
  cm::ChunkReader r(f.string(), {});
  Rows rows;
  auto on_row = [&](const cm::Row& row){ rows.emplace_back(row.begin(), row.end()); };
  bool ok = r.for_each_line([&](std::string_view s){ return csv.feed(s, on_row); });
  ok = ok && csv.finish(on_row);

  if (!ok) { std::cerr << "[FAIL] csv_fsm error: " << csv.error() << "\n"; return 1; }
  test::check(rows.size() == 6, "expected header + 5 data rows, got " + std::to_string(rows.size()));
  if (rows.size() == 6) {
    test::check(rows[2] == std::vector<std::string>{"x,y", "z", "q\"r"}, "quoted delimiter / doubled quote");
    test::check(rows[3] == std::vector<std::string>{"", "", ""}, "empty cells");
    test::check(rows[4] == std::vector<std::string>{"multi\nline", "2", "3"}, "multi-line quoted cell");
    test::check(rows[5] == std::vector<std::string>{"", "", ""}, "quoted empty cell");
  }
  test::check(csv.rows() == 6, "rows() counter");

  {
    cm::CsvFsm bad;
    Rows out;
    test::check(!feed_all(bad, {"a,b", "x\"y,z"}, out), "bare quote rejected");
    test::check(bad.error().find("line 2") != std::string::npos, "error names the line: " + bad.error());
  }
  {
    cm::CsvFsm bad;
    Rows out;
    test::check(!feed_all(bad, {"\"abc\"d,e"}, out), "text after closing quote rejected");
  }
  {
    cm::CsvFsm open;
    Rows out;
    test::check(!feed_all(open, {"a,b", "\"never", "closed"}, out), "unterminated quote rejected at finish");
    test::check(out.size() == 1, "rows before the open quote still emitted");
  }
  {
    cm::CsvFsm trailing;
    Rows out;
    test::check(feed_all(trailing, {"a,", ",", "", "\"\""}, out), "trailing delimiters");
    test::check(out.size() == 3, "blank line skipped");
    if (out.size() == 3) {
      test::check(out[0] == std::vector<std::string>{"a", ""}, "trailing empty cell");
      test::check(out[1] == std::vector<std::string>{"", ""}, "lone delimiter");
      test::check(out[2] == std::vector<std::string>{""}, "quoted empty line is a row");
    }
  }

  return test::finish("csv_fsm");
}
