#include "csvmap/path_utils.hpp"
#include "csvmap/row_io.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static bool expected_ok_for(const fs::path& p) {
  const std::string n = p.filename().string();
  if (n.find("bad") != std::string::npos) return false;
  if (n.find("malformed") != std::string::npos) return false;
  return true;
}

static std::string show_snippet(std::string_view s, size_t max = 180) {
  std::string out; out.reserve(s.size());
  auto push_hex = [&](unsigned char c){
    const char *hex = "0123456789ABCDEF";
    out += "\\x"; out += hex[c>>4]; out += hex[c&0xF];
  };
  for (unsigned char c : s) {
    if (c == '\n') { out += "\\n"; }
    else if (c == '\r') { out += "\\r"; }
    else if (c == '\t') { out += "\\t"; }
    else if (c < 0x20 || c == 0x7f) { push_hex(c); }
    else { out.push_back(static_cast<char>(c)); }
    if (out.size() >= max) { out += "..."; break; }
  }
  return out;
}

struct Res {
  bool ok{true};
  uint64_t rows{0};
  uint64_t bytes{0};
  std::string err;
};

static Res run(const fs::path& f){
  Res r;
  cm::RowGrid grid;
  cm::Error e;
  r.ok = cm::read_rows(f.string(), grid, &e);
  r.rows = grid.data_rows();
  r.bytes = grid.text_bytes();
  if (!r.ok) r.err = e.describe();
  return r;
}

int main(int argc, char** argv){
  fs::path dir = (argc > 1) ? fs::path(argv[1]) : fs::path("tests/data");
  if (!fs::exists(dir)) {
    std::cerr << "[ERR] fixtures dir not found: " << dir << "\n";
    return 2;
  }

  size_t total=0, passed=0, failed=0;
  for (auto& it : fs::directory_iterator(dir)) {
    if (!it.is_regular_file()) continue;
    const fs::path p = it.path();
    if (cm::detect_format(p.string()) == cm::FileFormat::Unknown) continue;

    Res r = run(p);

    const bool expect_ok = expected_ok_for(p);
    const bool verdict = (r.ok == expect_ok);

    ++total; verdict ? ++passed : ++failed;

    if (verdict) {
      std::cout << "[PASS] " << p.filename().string()
                << "  rows=" << r.rows
                << "  bytes=" << r.bytes
                << "  expected_ok=" << (expect_ok?"true":"false") << "\n";
    } else {
      std::cout << "[FAIL] " << p.filename().string()
                << "  rows=" << r.rows
                << "  bytes=" << r.bytes
                << "  expected_ok=" << (expect_ok?"true":"false")
                << "  actual_ok=" << (r.ok?"true":"false") << "\n";
      if (!r.err.empty())
        std::cout << "       error: " << show_snippet(r.err) << "\n";
    }
  }

  std::cout << "\nSummary: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
  return failed == 0 ? 0 : 1;
}
