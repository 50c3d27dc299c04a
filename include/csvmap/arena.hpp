#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace cm {

// Block-chained bump allocator. Views handed out by copy() stay valid until
// reset() or destruction; growing never moves existing blocks.
class Arena {
public:
  explicit Arena(std::size_t block_bytes = 64 * 1024);

  Arena(Arena&&) noexcept = default;
  Arena& operator=(Arena&&) noexcept = default;
  Arena(const Arena&) = delete;
  Arena& operator=(const Arena&) = delete;

  void* alloc(std::size_t n);
  std::string_view copy(std::string_view s);

  // Drop everything but the first block; invalidates all views.
  void reset() noexcept;

  std::size_t used() const noexcept;
  std::size_t capacity() const noexcept;
  std::size_t high_water() const noexcept;

private:
  struct Block {
    std::unique_ptr<char[]> data;
    std::size_t size{0};
  };

  std::size_t block_bytes_;
  std::vector<Block> blocks_;
  std::size_t head_{0};       // offset into blocks_.back()
  std::size_t used_{0};
  std::size_t high_water_{0};
};

}
