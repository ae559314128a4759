#include "ivmtr_scanner/object_extractor.hpp"
#include "ivmtr_scanner/cursor.hpp"

namespace ivmtr {

ScanStatus ObjectExtractor::next(Cursor& cur, std::string_view& out) {
  err_.clear();
  QuoteState q;
  std::size_t i = 0;
  int depth = 0;

  char c;
  while (cur.next(c)) {
    if (i == 0) {
      // Between elements: separators, whitespace, the closing bracket, or '{'.
      if (is_ws(c) || c == ',') continue;
      if (c == ']') return ScanStatus::EndOfFile;
      if (c != '{') {
        err_ = std::string("unexpected token '") + c + "' at " + cur.where();
        return ScanStatus::InvalidFormat;
      }
    } else if (!q.inside && is_ws(c)) {
      continue;
    }

    if (i == cap_) {
      err_ = "object exceeds the " + std::to_string(cap_) + " byte extraction buffer at " + cur.where();
      return ScanStatus::BufferOverflow;
    }
    buf_[i++] = c;

    if (q.step(c) || q.inside) continue;
    if (c == '{') {
      ++depth;
    } else if (c == '}' && --depth == 0) {
      out = std::string_view(buf_, i);
      return ScanStatus::Ok;
    }
  }

  if (cur.read_failed()) {
    err_ = cur.read_error() + " at " + cur.where();
    return ScanStatus::ReadError;
  }
  if (i == 0) return ScanStatus::EndOfFile;
  err_ = std::string("object not terminated") + (q.inside ? " (open string literal)" : "") +
         " at " + cur.where();
  return ScanStatus::ObjectNotTerminated;
}

}
