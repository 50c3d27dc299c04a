#include "csvmap/path_utils.hpp"
#include <cctype>
#include <system_error>

namespace cm {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

FileFormat detect_format(std::string_view path) {
  auto ext = std::filesystem::path(std::string(path)).extension().string();
  for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (ext == ".csv") return FileFormat::CSV;
  if (ext == ".jsonl" || ext == ".ndjson") return FileFormat::JSONL;
  return FileFormat::Unknown;
}

std::filesystem::path temp_path_for(const std::filesystem::path& p) {
  std::filesystem::path tmp = p;
  tmp += ".tmp";
  return tmp;
}

}
