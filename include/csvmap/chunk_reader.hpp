#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace cm {

class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes      = 512 * 1024;      // 512 KiB
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per line
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Return false from the callback to stop early.
  using LineCallback = std::function<bool(std::string_view)>;

  // Streams every line (without its terminator) to `cb`. Returns false on
  // open/read failure, an over-long line, or when `cb` stops the scan;
  // error() is empty in the last case.
  bool for_each_line(const LineCallback& cb);

  int  last_error() const noexcept;
  const std::string& error() const noexcept;
  std::uint64_t bytes_read() const noexcept;
  std::uint64_t lines_read() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
