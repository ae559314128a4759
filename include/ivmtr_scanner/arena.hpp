#pragma once
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace ivmtr {

// Bump allocator backing one record's decoded strings. Memory is chained in
// blocks so earlier allocations stay put while later ones grow the arena.
class Arena {
public:
  explicit Arena(std::size_t block_bytes = 4096);

  void* alloc(std::size_t n);

  // Copies s and appends a NUL; the view excludes the terminator.
  std::string_view copy(std::string_view s);

  // Rewind to empty; blocks are kept for reuse.
  void reset() noexcept;

  // Rewind and free every block except the first.
  void release();

  std::size_t used() const noexcept;
  std::size_t capacity() const noexcept;
  std::size_t high_water() const noexcept;

private:
  struct Block {
    std::unique_ptr<char[]> data;
    std::size_t size{0};
  };

  std::vector<Block> blocks_;
  std::size_t block_bytes_;
  std::size_t cur_{0};   // index of the block being filled
  std::size_t head_{0};  // offset inside blocks_[cur_]
  std::size_t used_{0};
  std::size_t high_water_{0};
};

}
