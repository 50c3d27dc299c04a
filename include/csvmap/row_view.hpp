#pragma once
#include <string_view>
#include <vector>
#include <cstddef>

namespace cm {

using Row = std::vector<std::string_view>;

// Lightweight view over one tokenized row and, optionally, the header row
// it was read under. Does not own either.
class RowView {
public:
  RowView() = default;
  RowView(const Row* header, const Row* cells, std::size_t line = 0)
      : header_(header), cells_(cells), line_(line) {}

  std::size_t size() const noexcept { return cells_ ? cells_->size() : 0; }
  bool has(std::size_t i) const noexcept { return i < size(); }

  // Cell by index; empty view when out of range (check has() first).
  std::string_view at(std::size_t i) const {
    return has(i) ? (*cells_)[i] : std::string_view{};
  }

  // Header name for column i (if a header is attached).
  std::string_view colname(std::size_t i) const {
    return (header_ && i < header_->size()) ? (*header_)[i] : std::string_view{};
  }

  // 1-based data row number (header excluded); 0 when unknown.
  std::size_t line() const noexcept { return line_; }

  const Row* header() const noexcept { return header_; }
  const Row* cells() const noexcept { return cells_; }

private:
  const Row* header_{nullptr};
  const Row* cells_{nullptr};
  std::size_t line_{0};
};

}
