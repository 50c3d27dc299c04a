#include "csvmap/token_csv_fsm.hpp"
#include <string_view>
#include <vector>

namespace cm {

static constexpr char kDelimiter = ',';
static constexpr char kQuote     = '"';

CsvFsm::CsvFsm() : scratch_(16 * 1024) {}

bool CsvFsm::pending() const noexcept { return mode_ == Mode::Quoted; }

void CsvFsm::end_cell() {
  fields_.emplace_back(scratch_.copy(cell_));
  cell_.clear();
}

void CsvFsm::emit(const RowCallback& on_row) {
  on_row(fields_);
  ++rows_;
  fields_.clear();
  scratch_.reset();
  mode_ = Mode::FieldStart;
}

bool CsvFsm::fail(std::string msg) {
  err_ = "line " + std::to_string(record_line_) + ": " + msg;
  fields_.clear();
  cell_.clear();
  scratch_.reset();
  mode_ = Mode::FieldStart;
  return false;
}

bool CsvFsm::feed(std::string_view line, const RowCallback& on_row) {
  ++line_no_;
  if (mode_ == Mode::Quoted) {
    cell_.push_back('\n');            // record continues inside a quoted cell
  } else {
    if (line.empty()) return true;    // blank line
    record_line_ = line_no_;
  }

  for (char c : line) {
    switch (mode_) {
      case Mode::FieldStart:
        if (c == kQuote) {
          mode_ = Mode::Quoted;
        } else if (c == kDelimiter) {
          end_cell();
        } else {
          cell_.push_back(c);
          mode_ = Mode::Unquoted;
        }
        break;
      case Mode::Unquoted:
        if (c == kDelimiter) {
          end_cell();
          mode_ = Mode::FieldStart;
        } else if (c == kQuote) {
          return fail("bare \" in non-quoted field");
        } else {
          cell_.push_back(c);
        }
        break;
      case Mode::Quoted:
        if (c == kQuote) mode_ = Mode::QuoteEscape;
        else cell_.push_back(c);
        break;
      case Mode::QuoteEscape:
        if (c == kQuote) {
          cell_.push_back(kQuote);        // escaped quote
          mode_ = Mode::Quoted;
        } else if (c == kDelimiter) {
          end_cell();
          mode_ = Mode::FieldStart;
        } else {
          return fail("extraneous \" in field");
        }
        break;
    }
  }

  if (mode_ == Mode::Quoted) return true;  // wait for the closing quote
  end_cell();
  emit(on_row);
  return true;
}

bool CsvFsm::finish(const RowCallback&) {
  if (mode_ == Mode::Quoted) return fail("quoted field not terminated at end of input");
  return true;
}

}
