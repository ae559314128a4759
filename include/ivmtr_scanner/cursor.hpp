#pragma once
#include <cstdint>
#include <string>
#include <utility>

#include "ivmtr_scanner/feed_stream.hpp"

namespace ivmtr {

struct Telemetry {
  std::uint64_t line   = 1;
  std::uint64_t column = 0;
  std::string   file;
};

// Quote parity with backslash escapes. step() returns true when c opened or
// closed a string literal.
struct QuoteState {
  bool inside  = false;
  bool escaped = false;

  bool step(char c) noexcept {
    if (inside) {
      if (escaped) { escaped = false; return false; }
      if (c == '\\') { escaped = true; return false; }
      if (c == '"') { inside = false; return true; }
      return false;
    }
    if (c == '"') { inside = true; return true; }
    return false;
  }
};

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\v';
}

// Single logical read position over a FeedStream, with line/column kept for
// diagnostics.
class Cursor {
public:
  Cursor(FeedStream& src, std::string file) : src_(src) { tel_.file = std::move(file); }

  bool next(char& c) {
    if (!src_.next_byte(c)) return false;
    if (c == '\n') { ++tel_.line; tel_.column = 0; }
    else ++tel_.column;
    return true;
  }

  bool read_failed() const noexcept { return src_.failed(); }
  const std::string& read_error() const noexcept { return src_.error(); }
  const Telemetry& telemetry() const noexcept { return tel_; }

  // "<file>, line L, column C"
  std::string where() const;

private:
  FeedStream& src_;
  Telemetry tel_;
};

}
