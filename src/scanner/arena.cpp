#include "ivmtr_scanner/arena.hpp"
#include <algorithm>
#include <cstring>
#include <memory>

namespace ivmtr {

Arena::Arena(std::size_t block_bytes) : block_bytes_(std::max<std::size_t>(block_bytes, 64)) {}

void* Arena::alloc(std::size_t n) {
  while (cur_ < blocks_.size() && head_ + n > blocks_[cur_].size) {
    ++cur_;
    head_ = 0;
  }
  if (cur_ == blocks_.size()) {
    // Oversized requests get a block of their own.
    Block b;
    b.size = std::max(n, block_bytes_);
    b.data = std::make_unique<char[]>(b.size);
    blocks_.push_back(std::move(b));
    head_ = 0;
  }
  void* p = blocks_[cur_].data.get() + head_;
  head_ += n;
  used_ += n;
  if (used_ > high_water_) high_water_ = used_;
  return p;
}

std::string_view Arena::copy(std::string_view s) {
  char* p = static_cast<char*>(alloc(s.size() + 1));
  if (!s.empty()) std::memcpy(p, s.data(), s.size());
  p[s.size()] = '\0';
  return std::string_view(p, s.size());
}

void Arena::reset() noexcept { cur_ = 0; head_ = 0; used_ = 0; }

void Arena::release() {
  reset();
  if (blocks_.size() > 1) blocks_.resize(1);
}

std::size_t Arena::used() const noexcept { return used_; }

std::size_t Arena::capacity() const noexcept {
  std::size_t total = 0;
  for (const auto& b : blocks_) total += b.size;
  return total;
}

std::size_t Arena::high_water() const noexcept { return high_water_; }

}
