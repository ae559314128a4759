#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "ivmtr_scanner/cursor.hpp"
#include "ivmtr_scanner/feed_stream.hpp"
#include "ivmtr_scanner/scan_record.hpp"
#include "ivmtr_scanner/status.hpp"

namespace ivmtr {

// One open-to-close pass over an IV-MTR feed file. At most one session may be
// open per thread. A session may be closed from another thread, but must be
// closed before the thread that opened it exits.
class FeedSession {
public:
  struct Config {
    FeedStream::Config stream;
    std::size_t object_bytes   = 4096;   // extraction buffer per element
    bool        lock_file      = false;  // shared advisory lock while open
    bool        replace_active = false;  // close this thread's open session instead of Conflict
  };

  enum class State { Closed, ArrayNotYetOpen, ArrayOpen, Exhausted, Failed };

  FeedSession();
  ~FeedSession();

  FeedSession(const FeedSession&) = delete;
  FeedSession& operator=(const FeedSession&) = delete;

  ScanStatus open(const std::string& path);
  ScanStatus open(const std::string& path, Config cfg);

  // Ok fills `out`; its strings are valid until the next next() or close().
  ScanStatus next(ScanRecord& out);

  // Releases the worker, file, buffer and arena. Idempotent.
  void close();

  State state() const noexcept;
  bool  is_open() const noexcept;
  const std::string& last_error() const noexcept;
  const Telemetry*   telemetry() const noexcept;
  std::uint64_t records() const noexcept;
  std::uint64_t bytes_read() const noexcept;

  // The session currently open on the calling thread, if any.
  static FeedSession* active() noexcept;

private:
  ScanStatus fail(ScanStatus s, std::string msg);

  struct Impl; Impl* p_{nullptr};
  State state_{State::Closed};
  ScanStatus sticky_{ScanStatus::Ok};
  std::uint64_t records_{0};
  std::string err_;
};

std::string_view to_string(FeedSession::State s) noexcept;

}
