#include "csvmap/row_io.hpp"
#include "csvmap/path_utils.hpp"
#include "csvmap/token_csv_fsm.hpp"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace cm {

bool read_csv_rows(const std::string& path, RowGrid& out, Error* err, const SourceConfig& cfg) {
  RowGrid grid;
  CsvFsm csv;
  ChunkReader reader(path, cfg.reader);

  auto on_row = [&](const Row& row) { grid.add_row(row); };
  bool ok = reader.for_each_line([&](std::string_view line) {
    return csv.feed(line, on_row);
  });

  if (!ok) {
    if (!reader.error().empty()) return fail(err, source_error(reader.error()));
    return fail(err, source_error("unable to parse " + path + " as CSV: " + csv.error()));
  }
  if (!csv.finish(on_row))
    return fail(err, source_error("unable to parse " + path + " as CSV: " + csv.error()));

  out = std::move(grid);
  return true;
}

bool read_jsonl_rows(const std::string& path, RowGrid& out, Error* err, const SourceConfig& cfg) {
  RowGrid grid;
  JsonlTokenizer tok(cfg.jsonl);
  ChunkReader reader(path, cfg.reader);

  std::uint64_t line_no = 0;
  bool ok = reader.for_each_line([&](std::string_view line) {
    ++line_no;
    return tok.feed_line(line, [&](const Row& row) { grid.add_row(row); });
  });

  if (!ok) {
    if (!reader.error().empty()) return fail(err, source_error(reader.error()));
    return fail(err, source_error("unable to parse " + path + " line " +
                                  std::to_string(line_no) + ": " + tok.error()));
  }

  out = std::move(grid);
  return true;
}

bool read_rows(const std::string& path, RowGrid& out, Error* err, const SourceConfig& cfg) {
  if (detect_format(path) == FileFormat::JSONL) return read_jsonl_rows(path, out, err, cfg);
  return read_csv_rows(path, out, err, cfg);
}

static bool needs_quotes(std::string_view cell) {
  if (cell.empty()) return false;
  if (cell == "\\.") return true;
  for (char c : cell) {
    if (c == ',' || c == '"' || c == '\r' || c == '\n') return true;
  }
  return std::isspace(static_cast<unsigned char>(cell.front())) != 0;
}

void append_csv_row(std::string& out, const Row& row) {
  // A bare empty line is skipped on read; keep the record visible.
  if (row.empty() || (row.size() == 1 && row[0].empty())) {
    out.append("\"\"\n");
    return;
  }
  for (std::size_t i = 0; i < row.size(); ++i) {
    if (i) out.push_back(',');
    std::string_view cell = row[i];
    if (!needs_quotes(cell)) {
      out.append(cell);
      continue;
    }
    out.push_back('"');
    for (char c : cell) {
      if (c == '"') out.push_back('"');
      out.push_back(c);
    }
    out.push_back('"');
  }
  out.push_back('\n');
}

bool write_csv_rows(const std::string& path, const RowGrid& rows, Error* err) {
  const std::filesystem::path target(path);
  const std::filesystem::path tmp = temp_path_for(target);

  if (!ensure_parent_dirs(target))
    return fail(err, sink_error("unable to create parent directory of " + path));

  auto discard = [&](std::string msg) {
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return fail(err, sink_error(std::move(msg)));
  };

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) return discard("unable to write file " + tmp.string() + ": " + std::strerror(errno));

    std::string buf;
    buf.reserve(64 * 1024);
    for (const auto& row : rows.rows()) {
      append_csv_row(buf, row);
      if (buf.size() >= 60 * 1024) {
        out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
        buf.clear();
      }
    }
    out.write(buf.data(), static_cast<std::streamsize>(buf.size()));
    out.close();
    if (!out) return discard("write error on " + tmp.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) return discard("unable to replace " + path + ": " + ec.message());
  return true;
}

}
