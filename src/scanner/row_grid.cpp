#include "csvmap/row_grid.hpp"

namespace cm {

RowGrid::RowGrid(std::size_t arena_block_bytes) : arena_(arena_block_bytes) {}

void RowGrid::add_row(std::initializer_list<std::string_view> cells) {
  Row row;
  row.reserve(cells.size());
  for (auto c : cells) row.push_back(arena_.copy(c));
  rows_.push_back(std::move(row));
}

void RowGrid::clear() noexcept {
  rows_.clear();
  arena_.reset();
}

RowView RowGrid::data_view(std::size_t i) const {
  return RowView(&rows_.front(), &rows_[i + 1], i + 1);
}

}
