#include "csvmap/schema.hpp"
#include <string_view>
#include <unordered_map>

namespace cm {

std::vector<std::string> header_of(const Schema& schema) {
  std::vector<std::string> out;
  out.reserve(schema.size());
  for (const auto& e : schema) out.push_back(e.column);
  return out;
}

bool check_unique_columns(const Schema& schema, Error* err) {
  std::unordered_map<std::string_view, std::size_t> seen;
  seen.reserve(schema.size());
  for (const auto& e : schema) {
    if (!seen.emplace(e.column, e.field_index).second)
      return fail(err, duplicate_column(e.field, e.column));
  }
  return true;
}

}
