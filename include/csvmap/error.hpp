#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace cm {

enum class ErrorCode {
  None,
  ColumnNotFound,
  DuplicateColumnMapping,
  RowTooShort,
  InvalidBool,
  InvalidInt,
  InvalidFloat,
  SourceReadError,
  SinkWriteError,
};

std::string_view to_string(ErrorCode c) noexcept;

// Failure report filled by every fallible call. Only the members relevant to
// `code` are set.
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string field;    // record field identifier
  std::string column;   // column name from the annotation
  std::string value;    // offending cell text
  std::size_t index = 0; // column index (RowTooShort)
  std::size_t row = 0;   // 1-based data row, 0 if not row related
  std::string message;  // collaborator message (source/sink)

  explicit operator bool() const noexcept { return code != ErrorCode::None; }

  // One-line human readable diagnostic.
  std::string describe() const;
};

// Fill `*out` if non-null; always returns false so callers can
// `return fail(err, ...)`.
bool fail(Error* out, Error e);

Error column_not_found(std::string column);
Error duplicate_column(std::string field, std::string column);
Error row_too_short(std::string field, std::size_t index);
Error invalid_value(ErrorCode code, std::string field, std::string_view value);
Error source_error(std::string message);
Error sink_error(std::string message);

}
