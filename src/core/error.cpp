#include "csvmap/error.hpp"
#include <sstream>
#include <utility>

namespace cm {

std::string_view to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::None:                   return "None";
    case ErrorCode::ColumnNotFound:         return "ColumnNotFound";
    case ErrorCode::DuplicateColumnMapping: return "DuplicateColumnMapping";
    case ErrorCode::RowTooShort:            return "RowTooShort";
    case ErrorCode::InvalidBool:            return "InvalidBool";
    case ErrorCode::InvalidInt:             return "InvalidInt";
    case ErrorCode::InvalidFloat:           return "InvalidFloat";
    case ErrorCode::SourceReadError:        return "SourceReadError";
    case ErrorCode::SinkWriteError:         return "SinkWriteError";
  }
  return "Unknown";
}

std::string Error::describe() const {
  std::ostringstream o;
  o << to_string(code);
  switch (code) {
    case ErrorCode::None:
      break;
    case ErrorCode::ColumnNotFound:
      o << ": column \"" << column << "\" does not exist in header";
      break;
    case ErrorCode::DuplicateColumnMapping:
      o << ": field " << field << " maps to column \"" << column
        << "\" already claimed by another field";
      break;
    case ErrorCode::RowTooShort:
      o << ": field " << field << " needs column index " << index;
      break;
    case ErrorCode::InvalidBool:
    case ErrorCode::InvalidInt:
    case ErrorCode::InvalidFloat:
      o << ": field " << field << " invalid value \"" << value << "\"";
      break;
    case ErrorCode::SourceReadError:
    case ErrorCode::SinkWriteError:
      o << ": " << message;
      break;
  }
  if (row) o << " (row " << row << ")";
  return o.str();
}

bool fail(Error* out, Error e) {
  if (out) *out = std::move(e);
  return false;
}

Error column_not_found(std::string column) {
  Error e;
  e.code = ErrorCode::ColumnNotFound;
  e.column = std::move(column);
  return e;
}

Error duplicate_column(std::string field, std::string column) {
  Error e;
  e.code = ErrorCode::DuplicateColumnMapping;
  e.field = std::move(field);
  e.column = std::move(column);
  return e;
}

Error row_too_short(std::string field, std::size_t index) {
  Error e;
  e.code = ErrorCode::RowTooShort;
  e.field = std::move(field);
  e.index = index;
  return e;
}

Error invalid_value(ErrorCode code, std::string field, std::string_view value) {
  Error e;
  e.code = code;
  e.field = std::move(field);
  e.value = std::string(value);
  return e;
}

Error source_error(std::string message) {
  Error e;
  e.code = ErrorCode::SourceReadError;
  e.message = std::move(message);
  return e;
}

Error sink_error(std::string message) {
  Error e;
  e.code = ErrorCode::SinkWriteError;
  e.message = std::move(message);
  return e;
}

}
