#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace cm {

enum class FileFormat { CSV, JSONL, Unknown };

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Guess format from extension (.csv | .jsonl | .ndjson), case-insensitive.
FileFormat detect_format(std::string_view path);

// Sibling path used while a file is being written ("<name>.tmp").
std::filesystem::path temp_path_for(const std::filesystem::path& p);

}
