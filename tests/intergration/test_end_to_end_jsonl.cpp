#include "csvmap/mapper.hpp"
#include "../test_support.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main() {
  const fs::path in = "tests/data/people.jsonl";
  if (!fs::exists(in)) { std::cerr << "[ERR] fixture not found: " << in << "\n"; return 2; }

  std::vector<Person> from_jsonl, from_csv;
  cm::MetricsRegistry metrics;
  cm::ReadOptions opts;
  opts.metrics = &metrics;
  cm::Error err;
  test::check(cm::read_records(in.string(), from_jsonl, &err, opts), "read jsonl: " + err.describe());
  test::check(cm::read_records("tests/data/people.csv", from_csv, &err), "read csv: " + err.describe());

  bool same = from_jsonl.size() == 2 && from_csv.size() == 2;
  for (std::size_t i = 0; same && i < 2; ++i)
    same = from_jsonl[i].name == from_csv[i].name && from_jsonl[i].active == from_csv[i].active;
  test::check(same, "JSON Lines and CSV sources decode alike");
  test::check(metrics.rows() == 2 && metrics.bytes() > 0, "rows and bytes counted");
  test::check(metrics.has_stage("read") && metrics.has_stage("bind") && metrics.has_stage("decode"), "stages timed");

  const fs::path dir = fs::temp_directory_path() / ("csvmap-e2e-jsonl-" + std::to_string(std::time(nullptr)));
  fs::create_directories(dir);

  // Numbers keep their spelling, so integer fields decode from JSON numbers.
  const fs::path samples = dir / "samples.ndjson";
  {
    std::ofstream o(samples.string());
    o << R"({"label":"a","flag":"T","tiny":-3,"small":12,"count":7,"big":1,"huge":9007199254740993,"ratio":0.5,"score":1e3})" "\n";
    o << R"({"score":-2,"label":"b","flag":"0","tiny":0,"small":0,"count":0,"big":0,"huge":0,"ratio":0})" "\n";
  }
  std::vector<Sample> rows;
  test::check(cm::read_records(samples.string(), rows, &err), "read ndjson: " + err.describe());
  if (rows.size() == 2) {
    test::check(rows[0].huge == 9007199254740993LL && rows[0].tiny == -3 && rows[0].flag, "first object");
    test::check(rows[0].ratio == 0.5f && rows[0].score == 1000.0, "float literals");
    test::check(rows[1].label == "b" && rows[1].score == -2.0 && !rows[1].flag, "keys aligned to first header");
  } else {
    test::check(false, "expected 2 samples, got " + std::to_string(rows.size()));
  }

  // JSON booleans are cells "true"/"false"; a float literal is not an int.
  const fs::path bad_int = dir / "bad_int.jsonl";
  { std::ofstream o(bad_int.string()); o << R"({"label":"x","flag":true,"tiny":1.5,"small":0,"count":0,"big":0,"huge":0,"ratio":0,"score":0})" "\n"; }
  cm::ReadOptions quiet;
  quiet.log = nullptr;
  test::check(!cm::read_records(bad_int.string(), rows, &err, quiet) &&
              err.code == cm::ErrorCode::InvalidInt && err.field == "Tiny" && err.value == "1.5",
              "float literal rejected for an int field: " + err.describe());

  test::check(!cm::read_records("tests/data/bad_not_object.jsonl", from_jsonl, &err, quiet), "non-object line");
  test::check(err.code == cm::ErrorCode::SourceReadError && err.message.find("line 2") != std::string::npos,
              "source error names the line: " + err.message);

  std::error_code ec;
  fs::remove_all(dir, ec);
  return test::finish("end-to-end JSONL");
}
