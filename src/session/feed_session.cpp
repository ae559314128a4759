#include "ivmtr_scanner/feed_session.hpp"
#include "ivmtr_scanner/arena.hpp"
#include "ivmtr_scanner/field_projector.hpp"
#include "ivmtr_scanner/key_locator.hpp"
#include "ivmtr_scanner/log.hpp"
#include "ivmtr_scanner/object_extractor.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <new>
#include <stdexcept>
#include <vector>

#if !defined(_WIN32)
  #include <sys/file.h>
#endif

namespace ivmtr {

namespace {

thread_local FeedSession* g_active = nullptr;

bool lock_shared(std::FILE* f, std::string& err) {
#if defined(_WIN32)
  (void)f;
  err = "file locking is not supported on this platform";
  return false;
#else
  if (::flock(::fileno(f), LOCK_SH | LOCK_NB) != 0) {
    err = std::string("could not lock: ") + std::strerror(errno);
    return false;
  }
  return true;
#endif
}

void unlock(std::FILE* f) {
#if !defined(_WIN32)
  (void)::flock(::fileno(f), LOCK_UN);
#else
  (void)f;
#endif
}

}

struct FeedSession::Impl {
  std::string path;
  Config cfg;
  std::FILE* f;
  bool locked;
  std::unique_ptr<FeedStream> stream;
  std::unique_ptr<Cursor> cursor;
  std::vector<char> buf;   // object_bytes plus parser padding
  ObjectExtractor extractor;
  FieldProjector projector;
  Arena arena;
  FeedSession** registry{nullptr};  // the opening thread's active-session slot

  Impl(std::string p, Config c, std::FILE* file, bool lk)
    : path(std::move(p)), cfg(c), f(file), locked(lk),
      buf(cfg.object_bytes + FieldProjector::padding(), '\0'),
      extractor(buf.data(), cfg.object_bytes),
      arena(512) {
    stream.reset(new FeedStream(f, cfg.stream));
    cursor.reset(new Cursor(*stream, path));
  }

  ~Impl() {
    // The worker must be gone before the FILE* it reads from.
    cursor.reset();
    stream.reset();
    if (locked) unlock(f);
    std::fclose(f);
  }
};

FeedSession::FeedSession() = default;

FeedSession::~FeedSession() { close(); }

FeedSession* FeedSession::active() noexcept { return g_active; }

ScanStatus FeedSession::open(const std::string& path) { return open(path, Config{}); }

ScanStatus FeedSession::open(const std::string& path, Config cfg) {
  if (p_) {
    err_ = "session already open on '" + p_->path + "'; close it before opening '" + path + "'";
    log::write(log::Level::Error, "feed", err_);
    return ScanStatus::Conflict;
  }
  if (g_active && g_active != this) {
    if (!cfg.replace_active) {
      err_ = "this thread already has an open feed session; close it before opening '" + path + "'";
      log::write(log::Level::Error, "feed", err_);
      return ScanStatus::Conflict;
    }
    log::write(log::Level::Info, "feed", "closing the active session to open '" + path + "'");
    g_active->close();
  }

  err_.clear();
  const std::size_t max_object = std::vector<char>().max_size() - FieldProjector::padding();
  if (cfg.object_bytes == 0 || cfg.object_bytes > max_object) {
    err_ = "failed to open '" + path + "': object_bytes must be between 1 and " + std::to_string(max_object);
    log::write(log::Level::Error, "feed", err_);
    return ScanStatus::FailedToOpen;
  }

  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) {
    err_ = "failed to open '" + path + "': " + std::strerror(errno);
    log::write(log::Level::Error, "feed", err_);
    return ScanStatus::FailedToOpen;
  }

  if (cfg.lock_file) {
    std::string why;
    if (!lock_shared(f, why)) {
      std::fclose(f);
      err_ = "failed to open '" + path + "': " + why;
      log::write(log::Level::Error, "feed", err_);
      return ScanStatus::FailedToOpen;
    }
  }

  auto out_of_memory = [&](const char* what) {
    if (cfg.lock_file) unlock(f);
    std::fclose(f);
    err_ = "out of memory opening '" + path + "': " + what;
    log::write(log::Level::Error, "feed", err_);
    return ScanStatus::OutOfMemory;
  };
  try {
    p_ = new Impl(path, cfg, f, cfg.lock_file);
  } catch (const std::bad_alloc& ex) {
    return out_of_memory(ex.what());
  } catch (const std::length_error& ex) {
    return out_of_memory(ex.what());
  }

  p_->registry = &g_active;
  state_ = State::ArrayNotYetOpen;
  sticky_ = ScanStatus::Ok;
  records_ = 0;
  g_active = this;
  return ScanStatus::Ok;
}

ScanStatus FeedSession::fail(ScanStatus s, std::string msg) {
  state_ = State::Failed;
  sticky_ = s;
  err_ = std::move(msg);
  log::write(log::Level::Error, "feed", std::string(to_string(s)) + ": " + err_);
  return s;
}

ScanStatus FeedSession::next(ScanRecord& out) {
  switch (state_) {
    case State::Closed:
      err_ = "no open feed session";
      return ScanStatus::NoActiveSession;
    case State::Exhausted:
      return ScanStatus::EndOfFile;
    case State::Failed:
      return sticky_;
    default:
      break;
  }

  err_.clear();
  p_->arena.reset();

  try {
    if (state_ == State::ArrayNotYetOpen) {
      std::string why;
      ScanStatus s = locate_events_array(*p_->cursor, why);
      if (s == ScanStatus::EndOfFile) {
        log::write(log::Level::Warn, "feed", "reached end of stream without an events array, "
                   "presumably an empty feed (" + p_->cursor->where() + ")");
        state_ = State::Exhausted;
        return s;
      }
      if (s != ScanStatus::Ok) return fail(s, why);
      state_ = State::ArrayOpen;
    }

    std::string_view obj;
    ScanStatus s = p_->extractor.next(*p_->cursor, obj);
    if (s == ScanStatus::EndOfFile) {
      state_ = State::Exhausted;
      return s;
    }
    if (s != ScanStatus::Ok) return fail(s, p_->extractor.error());

    s = p_->projector.project(obj, p_->buf.size(), p_->arena, out);
    if (s != ScanStatus::Ok) {
      if (log::enabled(log::Level::Debug))
        log::write(log::Level::Debug, "feed", "rejected object: " + std::string(obj));
      return fail(s, p_->projector.error() + " in object ending at " + p_->cursor->where());
    }
  } catch (const std::bad_alloc&) {
    return fail(ScanStatus::OutOfMemory, "allocation failed at " + p_->cursor->where());
  }

  ++records_;
  return ScanStatus::Ok;
}

void FeedSession::close() {
  if (!p_) return;
  if (*p_->registry == this) *p_->registry = nullptr;
  delete p_;
  p_ = nullptr;
  state_ = State::Closed;
}

FeedSession::State FeedSession::state() const noexcept { return state_; }
bool FeedSession::is_open() const noexcept { return p_ != nullptr; }
const std::string& FeedSession::last_error() const noexcept { return err_; }
const Telemetry* FeedSession::telemetry() const noexcept { return p_ ? &p_->cursor->telemetry() : nullptr; }
std::uint64_t FeedSession::records() const noexcept { return records_; }
std::uint64_t FeedSession::bytes_read() const noexcept { return p_ ? p_->stream->bytes_read() : 0; }

std::string_view to_string(FeedSession::State s) noexcept {
  switch (s) {
    case FeedSession::State::Closed:          return "closed";
    case FeedSession::State::ArrayNotYetOpen: return "array not yet open";
    case FeedSession::State::ArrayOpen:       return "array open";
    case FeedSession::State::Exhausted:       return "exhausted";
    case FeedSession::State::Failed:          return "failed";
  }
  return "unknown";
}

}
