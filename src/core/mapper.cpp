#include "csvmap/mapper.hpp"
#include <ostream>

namespace cm::detail {

void log_error(std::ostream* log, std::string_view stage, std::string_view path, const Error& e) {
  if (!log) return;
  *log << "[" << stage << "] ";
  if (!path.empty()) *log << path << ": ";
  *log << e.describe() << "\n";
}

}
