#pragma once
#include "csvmap/error.hpp"
#include "csvmap/field.hpp"
#include "csvmap/header_binder.hpp"
#include "csvmap/parse_policy.hpp"
#include "csvmap/row_grid.hpp"
#include "csvmap/row_view.hpp"
#include "csvmap/schema.hpp"
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace cm {

namespace detail {

// Returns ErrorCode::None on success; `dst` is untouched on failure.
template <class M>
ErrorCode decode_cell(M& dst, std::string_view cell, const ParsePolicy& p) {
  if constexpr (std::is_same_v<M, std::string>) {
    dst.assign(cell.data(), cell.size());
  } else if constexpr (std::is_same_v<M, bool>) {
    auto v = p.parse_bool(cell);
    if (!v) return ErrorCode::InvalidBool;
    dst = *v;
  } else if constexpr (std::is_same_v<M, float>) {
    auto v = p.parse_float(cell);
    if (!v) return ErrorCode::InvalidFloat;
    dst = *v;
  } else if constexpr (std::is_same_v<M, double>) {
    auto v = p.parse_double(cell);
    if (!v) return ErrorCode::InvalidFloat;
    dst = *v;
  } else {
    auto v = p.parse_int<M>(cell);
    if (!v) return ErrorCode::InvalidInt;
    dst = *v;
  }
  return ErrorCode::None;
}

template <class M>
std::string encode_cell(const M& v, const ParsePolicy& p) {
  if constexpr (std::is_same_v<M, std::string>) return v;
  else if constexpr (std::is_same_v<M, bool>) return p.format_bool(v);
  else if constexpr (std::is_floating_point_v<M>) return p.format_float(v, std::is_same_v<M, float>);
  else return p.format_int(static_cast<long long>(v));
}

}

// Decode one data row into a fresh record. `out` is assigned only when every
// bound field decoded; the first failing field aborts the row.
template <class T>
bool decode_row(const Binding& binding, const RowView& row, const RecordDescriptor<T>& desc,
                T& out, Error* err = nullptr, const ParsePolicy& policy = {}) {
  T rec{};
  for (const auto& b : binding) {
    if (!row.has(b.column_index)) {
      Error e = row_too_short(b.field, b.column_index);
      e.row = row.line();
      return fail(err, std::move(e));
    }
    std::string_view cell = row.at(b.column_index);
    ErrorCode ec = std::visit([&](auto mp) {
      return detail::decode_cell(rec.*mp, cell, policy);
    }, desc[b.field_index].ref);
    if (ec != ErrorCode::None) {
      Error e = invalid_value(ec, b.field, cell);
      e.row = row.line();
      return fail(err, std::move(e));
    }
  }
  out = std::move(rec);
  return true;
}

// Header row (schema order) followed by one row per record.
template <class T>
RowGrid encode_records(const Schema& schema, const RecordDescriptor<T>& desc,
                       const std::vector<T>& records, const ParsePolicy& policy = {}) {
  RowGrid grid;
  grid.add_row(header_of(schema));

  std::vector<std::string> cells(schema.size());
  for (const auto& rec : records) {
    for (std::size_t i = 0; i < schema.size(); ++i) {
      cells[i] = std::visit([&](auto mp) {
        return detail::encode_cell(rec.*mp, policy);
      }, desc[schema[i].field_index].ref);
    }
    grid.add_row(cells);
  }
  return grid;
}

}
