#pragma once
#include "csvmap/arena.hpp"
#include "csvmap/row_view.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cm {

// RFC 4180 style framing: ',' separated, '"' quoted, "" escapes a quote.
// Quoted cells may span lines; feed() then holds the record until the
// closing quote arrives. Blank lines are skipped.
class CsvFsm {
public:
  // `row` is only valid for the duration of the callback.
  using RowCallback = std::function<void(const Row& row)>;

  CsvFsm();

  // Feed one physical line (terminator stripped).
  bool feed(std::string_view line, const RowCallback& on_row);
  // Fails if a quoted cell is still open.
  bool finish(const RowCallback& on_row);

  bool pending() const noexcept;
  const std::string& error() const { return err_; }
  std::uint64_t rows() const { return rows_; }

private:
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape };

  void end_cell();
  void emit(const RowCallback& on_row);
  bool fail(std::string msg);

  Mode mode_{Mode::FieldStart};
  Arena scratch_;       // cell text of the record being assembled
  std::string cell_;
  Row fields_;
  std::uint64_t line_no_{0};
  std::uint64_t record_line_{0};
  std::uint64_t rows_{0};
  std::string err_;
};

}
