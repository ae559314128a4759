#include "ivmtr_scanner/feed_stream.hpp"
#include "ivmtr_scanner/log.hpp"

#include <algorithm>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace ivmtr {

struct FeedStream::Impl {
  enum class Chunk { Data, End, Error };
  enum class Fill { Idle, Requested, Ready, Failed };

  std::FILE* f;
  Config cfg;
  std::vector<char> buf[2];
  int active{0};
  bool eof_seen{false};   // the last completed read reached end of file
  bool started{false};
  std::uint64_t bytes{0};

  // Double-buffer handshake; everything below is guarded by mu.
  std::mutex mu;
  std::condition_variable cv;
  Fill fill{Fill::Idle};
  bool stopping{false};
  std::size_t fill_n{0};
  bool fill_eof{false};
  int fill_errno{0};
  std::thread worker;

  Impl(std::FILE* file, Config c) : f(file), cfg(c) {
    cfg.chunk_bytes = std::max<std::size_t>(cfg.chunk_bytes, 1);
    buf[0].resize(cfg.chunk_bytes);
    if (cfg.prefetch) buf[1].resize(cfg.chunk_bytes);
  }

  // A short read is end of file unless the stream reports an error.
  bool read_chunk(std::vector<char>& b, std::size_t& n, bool& eof, int& err) {
    n = std::fread(b.data(), 1, b.size(), f);
    eof = false;
    if (n < b.size()) {
      if (std::ferror(f)) { err = errno ? errno : EIO; return false; }
      eof = true;
    }
    return true;
  }

  void run() {
    std::unique_lock<std::mutex> lk(mu);
    for (;;) {
      cv.wait(lk, [&]{ return stopping || fill == Fill::Requested; });
      if (stopping) return;
      std::vector<char>& b = buf[active ^ 1];
      lk.unlock();

      std::size_t n = 0; bool eof = false; int err = 0;
      const bool ok = read_chunk(b, n, eof, err);

      lk.lock();
      fill_n = n;
      fill_eof = eof;
      fill_errno = err;
      fill = ok ? Fill::Ready : Fill::Failed;
      cv.notify_all();
    }
  }

  void request_fill() {
    {
      std::lock_guard<std::mutex> lk(mu);
      fill = Fill::Requested;
    }
    cv.notify_all();
  }

  void stop() {
    {
      std::lock_guard<std::mutex> lk(mu);
      stopping = true;
    }
    cv.notify_all();
    if (worker.joinable()) worker.join();
  }

  Chunk first_chunk(const char*& b, const char*& e, std::string& err) {
    started = true;
    std::size_t n = 0; int code = 0;
    if (!read_chunk(buf[0], n, eof_seen, code)) {
      err = std::string("read failed: ") + std::strerror(code);
      return Chunk::Error;
    }
    if (cfg.prefetch && !eof_seen) {
      try {
        worker = std::thread([this]{ run(); });
        request_fill();
      } catch (const std::system_error& ex) {
        log::write(log::Level::Warn, "feed", std::string("prefetch worker unavailable, reading synchronously: ") + ex.what());
        cfg.prefetch = false;
      }
    }
    return publish(buf[0], n, b, e);
  }

  Chunk sync_chunk(const char*& b, const char*& e, std::string& err) {
    if (eof_seen) return Chunk::End;
    std::size_t n = 0; int code = 0;
    if (!read_chunk(buf[0], n, eof_seen, code)) {
      err = std::string("read failed: ") + std::strerror(code);
      return Chunk::Error;
    }
    return publish(buf[0], n, b, e);
  }

  Chunk swap_chunk(const char*& b, const char*& e, std::string& err) {
    if (eof_seen) return Chunk::End;
    std::size_t n = 0;
    {
      std::unique_lock<std::mutex> lk(mu);
      if (!cv.wait_for(lk, cfg.swap_timeout, [&]{ return fill != Fill::Requested; })) {
        err = "prefetch worker did not deliver the next chunk within " +
              std::to_string(cfg.swap_timeout.count()) + " ms";
        return Chunk::Error;
      }
      if (fill == Fill::Failed) {
        err = std::string("prefetch read failed: ") + std::strerror(fill_errno);
        return Chunk::Error;
      }
      active ^= 1;
      n = fill_n;
      eof_seen = fill_eof;
      fill = Fill::Idle;
    }
    if (!eof_seen) request_fill();
    return publish(buf[active], n, b, e);
  }

  Chunk publish(const std::vector<char>& src, std::size_t n, const char*& b, const char*& e) {
    if (n == 0) return Chunk::End;
    bytes += n;
    b = src.data();
    e = src.data() + n;
    return Chunk::Data;
  }

  Chunk next_chunk(const char*& b, const char*& e, std::string& err) {
    if (!started) return first_chunk(b, e, err);
    return cfg.prefetch ? swap_chunk(b, e, err) : sync_chunk(b, e, err);
  }
};

FeedStream::FeedStream(std::FILE* f) : FeedStream(f, Config{}) {}

FeedStream::FeedStream(std::FILE* f, Config cfg) : p_(new Impl(f, cfg)) {}

FeedStream::~FeedStream() {
  stop();
  delete p_;
}

void FeedStream::stop() { p_->stop(); }

std::uint64_t FeedStream::bytes_read() const noexcept { return p_->bytes; }

bool FeedStream::refill() {
  if (failed_ || drained_) return false;
  const char* b = nullptr;
  const char* e = nullptr;
  switch (p_->next_chunk(b, e, err_)) {
    case Impl::Chunk::Data:
      cur_ = b;
      end_ = e;
      return true;
    case Impl::Chunk::End:
      drained_ = true;
      return false;
    case Impl::Chunk::Error:
      failed_ = true;
      return false;
  }
  return false;
}

}
