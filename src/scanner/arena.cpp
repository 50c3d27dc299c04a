#include "csvmap/arena.hpp"
#include <algorithm>
#include <cstring>

namespace cm {

Arena::Arena(std::size_t block_bytes)
  : block_bytes_(block_bytes ? block_bytes : 1) {}

void* Arena::alloc(std::size_t n) {
  if (blocks_.empty() || head_ + n > blocks_.back().size) {
    std::size_t sz = std::max(n, block_bytes_);
    blocks_.push_back(Block{std::unique_ptr<char[]>(new char[sz]), sz});
    head_ = 0;
  }
  void* p = blocks_.back().data.get() + head_;
  head_ += n;
  used_ += n;
  if (used_ > high_water_) high_water_ = used_;
  return p;
}

std::string_view Arena::copy(std::string_view s) {
  if (s.empty()) return {};
  void* p = alloc(s.size());
  std::memcpy(p, s.data(), s.size());
  return std::string_view(static_cast<const char*>(p), s.size());
}

void Arena::reset() noexcept {
  if (blocks_.size() > 1) blocks_.erase(blocks_.begin() + 1, blocks_.end());
  head_ = 0;
  used_ = 0;
}

std::size_t Arena::used() const noexcept { return used_; }

std::size_t Arena::capacity() const noexcept {
  std::size_t total = 0;
  for (const auto& b : blocks_) total += b.size;
  return total;
}

std::size_t Arena::high_water() const noexcept { return high_water_; }

}
