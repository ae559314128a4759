#pragma once
#include <string_view>

namespace ivmtr {

// Outcome of every session-level operation. EndOfFile is a terminal signal,
// not an error.
enum class ScanStatus {
  Ok,
  EndOfFile,
  NoActiveSession,
  Conflict,
  FailedToOpen,
  OutOfMemory,
  InvalidFormat,
  ObjectNotTerminated,
  BufferOverflow,
  ReadError
};

std::string_view to_string(ScanStatus s) noexcept;

// True for statuses that end a session's forward progress.
inline bool is_fatal(ScanStatus s) noexcept {
  return s != ScanStatus::Ok && s != ScanStatus::EndOfFile;
}

}
