#pragma once
#include "csvmap/chunk_reader.hpp"
#include "csvmap/error.hpp"
#include "csvmap/row_grid.hpp"
#include "csvmap/token_jsonl_simdjson.hpp"
#include <string>

namespace cm {

struct SourceConfig {
  ChunkReader::Config reader;
  JsonlConfig jsonl;
};

// Read a whole CSV file into `out` (header first). Failures surface as
// SourceReadError; `out` is replaced only on success.
bool read_csv_rows(const std::string& path, RowGrid& out, Error* err = nullptr,
                   const SourceConfig& cfg = {});

// Read a whole JSON Lines file into `out`; see JsonlTokenizer for the shape.
bool read_jsonl_rows(const std::string& path, RowGrid& out, Error* err = nullptr,
                     const SourceConfig& cfg = {});

// Dispatch on extension; anything not .jsonl/.ndjson is read as CSV.
bool read_rows(const std::string& path, RowGrid& out, Error* err = nullptr,
               const SourceConfig& cfg = {});

// Append one framed CSV record, '\n' terminated. Cells are quoted only when
// they contain ',', '"', '\r' or '\n', start with whitespace, or equal "\.".
// A row with no cells or a single empty cell is written as `""`.
void append_csv_row(std::string& out, const Row& row);

// Frame every row and persist atomically: write "<path>.tmp", then rename.
// Failures surface as SinkWriteError and leave no temporary file.
bool write_csv_rows(const std::string& path, const RowGrid& rows, Error* err = nullptr);

}
