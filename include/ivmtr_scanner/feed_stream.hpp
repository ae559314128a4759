#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace ivmtr {

// Chunked byte source over an open FILE*. With prefetch on, a worker thread
// fills the next chunk while the current one is drained.
class FeedStream {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024;              // 64 KiB per read
    bool        prefetch    = true;                   // double buffer + worker
    std::chrono::milliseconds swap_timeout{5000};     // bounded wait at swap
  };

  // Does not take ownership of f; the caller closes it after the stream.
  explicit FeedStream(std::FILE* f);
  FeedStream(std::FILE* f, Config cfg);
  ~FeedStream();

  FeedStream(const FeedStream&) = delete;
  FeedStream& operator=(const FeedStream&) = delete;

  // Next byte, or false at end-of-stream / read failure (see failed()).
  bool next_byte(char& out) {
    if (cur_ == end_ && !refill()) return false;
    out = *cur_++;
    return true;
  }

  // Stop the worker; safe to call twice.
  void stop();

  bool failed() const noexcept { return failed_; }
  bool at_end() const noexcept { return cur_ == end_ && drained_; }
  const std::string& error() const noexcept { return err_; }
  std::uint64_t bytes_read() const noexcept;

private:
  bool refill();

  struct Impl; Impl* p_;
  const char* cur_{nullptr};
  const char* end_{nullptr};
  bool drained_{false};
  bool failed_{false};
  std::string err_;
};

}
