#pragma once
#include "csvmap/arena.hpp"
#include "csvmap/row_view.hpp"
#include <cstddef>
#include <initializer_list>
#include <string_view>
#include <utility>
#include <vector>

namespace cm {

// Fully materialized tokenized table. Row 0 is the header; cell text lives
// in the grid's own arena so views survive moves of the grid.
class RowGrid {
public:
  explicit RowGrid(std::size_t arena_block_bytes = 64 * 1024);

  RowGrid(RowGrid&&) noexcept = default;
  RowGrid& operator=(RowGrid&&) noexcept = default;
  RowGrid(const RowGrid&) = delete;
  RowGrid& operator=(const RowGrid&) = delete;

  // Copies every cell into the arena.
  template <class Cells>
  void add_row(const Cells& cells) {
    Row row;
    row.reserve(cells.size());
    for (const auto& c : cells) row.push_back(arena_.copy(std::string_view(c)));
    rows_.push_back(std::move(row));
  }
  void add_row(std::initializer_list<std::string_view> cells);

  void clear() noexcept;

  bool empty() const noexcept { return rows_.empty(); }
  std::size_t size() const noexcept { return rows_.size(); }
  std::size_t data_rows() const noexcept { return rows_.empty() ? 0 : rows_.size() - 1; }

  const Row& header() const { return rows_.front(); }
  const Row& operator[](std::size_t i) const { return rows_[i]; }
  const std::vector<Row>& rows() const noexcept { return rows_; }

  // View of data row `i` (0-based, header excluded) attached to the header.
  RowView data_view(std::size_t i) const;

  std::size_t text_bytes() const noexcept { return arena_.used(); }

private:
  Arena arena_;
  std::vector<Row> rows_;
};

}
