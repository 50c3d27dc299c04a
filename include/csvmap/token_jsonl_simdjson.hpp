#pragma once
#include "csvmap/arena.hpp"
#include "csvmap/row_view.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace cm {

struct JsonlConfig {
  size_t cap_nested_value_bytes = 32 * 1024; // cap for arrays/objects raw storage
};

// Turns JSON Lines into rows. The first object's keys become the header
// row (emitted once, before the first data row); later objects are aligned
// to it by key and keys outside the header are ignored.
class JsonlTokenizer {
public:
  // `row` is only valid for the duration of the callback.
  using RowCallback = std::function<void(const Row& row)>;

  explicit JsonlTokenizer(const JsonlConfig& cfg = {});
  ~JsonlTokenizer();

  JsonlTokenizer(const JsonlTokenizer&) = delete;
  JsonlTokenizer& operator=(const JsonlTokenizer&) = delete;

  bool feed_line(std::string_view line, const RowCallback& on_row);

  const Row& header() const;
  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::string err_;
};

}
