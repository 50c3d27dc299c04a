#pragma once
#include "csvmap/error.hpp"
#include "csvmap/field.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace cm {

struct SchemaEntry {
  std::size_t field_index = 0; // position in the record descriptor
  std::string field;
  std::string column;
};

// Annotated fields in declaration order. Doubles as the output header.
using Schema = std::vector<SchemaEntry>;

// Column names of `schema`, in order.
std::vector<std::string> header_of(const Schema& schema);

// Rejects two entries sharing one column name.
bool check_unique_columns(const Schema& schema, Error* err = nullptr);

// Collect the annotated fields of `desc`. Unannotated fields are skipped.
template <class T>
bool resolve_schema(const RecordDescriptor<T>& desc, Schema& out, Error* err = nullptr) {
  Schema schema;
  schema.reserve(desc.size());
  for (std::size_t i = 0; i < desc.size(); ++i) {
    const auto& f = desc[i];
    if (!f.annotated()) continue;
    schema.push_back(SchemaEntry{i, f.name, f.column});
  }
  if (!check_unique_columns(schema, err)) return false;
  out = std::move(schema);
  return true;
}

}
