#pragma once
#include "csvmap/error.hpp"
#include "csvmap/row_view.hpp"
#include "csvmap/schema.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace cm {

struct BoundField {
  std::size_t field_index = 0;  // position in the record descriptor
  std::string field;
  std::size_t column_index = 0; // position in the header row
};

// Schema resolved against one concrete header, in schema order.
using Binding = std::vector<BoundField>;

// Resolve every schema column against `header`. Header names are matched
// exactly; a repeated header name binds to its last occurrence. On failure
// `out` is left empty.
bool bind_header(const Schema& schema, const Row& header, Binding& out,
                 Error* err = nullptr);

}
