#include "csvmap/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string_view>
#include <vector>

namespace cm {

namespace {
struct FileCloser {
  void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;
}

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::string err;
  std::uint64_t bytes{0};
  std::uint64_t lines{0};

  bool fail_errno(const char* what) {
    last_errno = errno;
    err = std::string(what) + " " + path + ": " + std::strerror(last_errno);
    return false;
  }

  bool emit(std::string_view line, const LineCallback& cb) {
    if (cfg.strip_cr && !line.empty() && line.back() == '\r') line.remove_suffix(1);
    ++lines;
    return cb(line);
  }

  bool oversize() {
    err = path + ": line " + std::to_string(lines + 1) + " exceeds " +
          std::to_string(cfg.max_record_bytes) + " bytes";
    return false;
  }

  bool for_each_line(const LineCallback& cb) {
    err.clear();
    last_errno = 0;
    bytes = 0;
    lines = 0;

    FilePtr f(std::fopen(path.c_str(), "rb"));
    if (!f) return fail_errno("unable to open");

    std::vector<char> buf(cfg.chunk_bytes ? cfg.chunk_bytes : 1);
    std::string carry;
    carry.reserve(256);

    while (true) {
      std::size_t n = std::fread(buf.data(), 1, buf.size(), f.get());
      if (n == 0 && std::ferror(f.get())) return fail_errno("unable to read");
      if (n == 0) break;
      bytes += n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (true) {
        std::size_t pos = block.find('\n', start);
        if (pos == std::string_view::npos) {
          // unfinished line: keep for the next block
          std::string_view tail = block.substr(start);
          if (carry.size() + tail.size() > cfg.max_record_bytes) return oversize();
          carry.append(tail);
          break;
        }

        std::string_view slice = block.substr(start, pos - start);
        if (carry.size() + slice.size() > cfg.max_record_bytes) return oversize();
        if (!carry.empty()) {
          carry.append(slice);
          if (!emit(carry, cb)) return false;
          carry.clear();
        } else {
          if (!emit(slice, cb)) return false;
        }
        start = pos + 1;
      }
    }

    if (!carry.empty()) return emit(carry, cb);
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::for_each_line(const LineCallback& cb) { return p_->for_each_line(cb); }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }
const std::string& ChunkReader::error() const noexcept { return p_->err; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t ChunkReader::lines_read() const noexcept { return p_->lines; }

}
