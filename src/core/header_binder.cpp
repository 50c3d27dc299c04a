#include "csvmap/header_binder.hpp"
#include <string_view>
#include <unordered_map>
#include <utility>

namespace cm {

bool bind_header(const Schema& schema, const Row& header, Binding& out, Error* err) {
  out.clear();

  std::unordered_map<std::string_view, std::size_t> col_num;
  col_num.reserve(header.size());
  for (std::size_t i = 0; i < header.size(); ++i) col_num[header[i]] = i; // last wins

  Binding binding;
  binding.reserve(schema.size());
  for (const auto& e : schema) {
    auto it = col_num.find(e.column);
    if (it == col_num.end()) return fail(err, column_not_found(e.column));
    binding.push_back(BoundField{e.field_index, e.field, it->second});
  }

  out = std::move(binding);
  return true;
}

}
