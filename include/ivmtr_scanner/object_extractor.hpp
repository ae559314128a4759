#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "ivmtr_scanner/status.hpp"

namespace ivmtr {

class Cursor;

// Copies one balanced {...} element of an opened array into a caller-owned
// buffer. Whitespace outside string literals is dropped; everything else is
// copied as read.
class ObjectExtractor {
public:
  ObjectExtractor(char* buf, std::size_t capacity) : buf_(buf), cap_(capacity) {}

  // Ok: out views the object inside the buffer. EndOfFile: the array closed
  // (or the stream ended between elements).
  ScanStatus next(Cursor& cur, std::string_view& out);

  std::size_t capacity() const noexcept { return cap_; }
  const std::string& error() const { return err_; }

private:
  char* buf_;
  std::size_t cap_;
  std::string err_;
};

}
