#include "ivmtr_scanner/status.hpp"

namespace ivmtr {

std::string_view to_string(ScanStatus s) noexcept {
  switch (s) {
    case ScanStatus::Ok:                  return "ok";
    case ScanStatus::EndOfFile:           return "end of file";
    case ScanStatus::NoActiveSession:     return "no active session";
    case ScanStatus::Conflict:            return "conflict";
    case ScanStatus::FailedToOpen:        return "failed to open";
    case ScanStatus::OutOfMemory:         return "out of memory";
    case ScanStatus::InvalidFormat:       return "invalid format";
    case ScanStatus::ObjectNotTerminated: return "object not terminated";
    case ScanStatus::BufferOverflow:      return "buffer overflow";
    case ScanStatus::ReadError:           return "read error";
  }
  return "unknown";
}

}
