#include "ivmtr_scanner/key_locator.hpp"
#include "ivmtr_scanner/cursor.hpp"
#include "ivmtr_scanner/log.hpp"

#include <string_view>

namespace ivmtr {

namespace {

constexpr std::string_view kEventsKey = "events";

ScanStatus stream_end(Cursor& cur, std::string& err) {
  if (cur.read_failed()) {
    err = cur.read_error() + " at " + cur.where();
    return ScanStatus::ReadError;
  }
  return ScanStatus::EndOfFile;
}

ScanStatus open_array(Cursor& cur, std::string& err) {
  char c;
  while (cur.next(c)) {
    if (is_ws(c)) continue;
    if (c == '[') return ScanStatus::Ok;
    err = std::string("first non-whitespace character after the events key's colon must be an "
                      "opening bracket, got '") + c + "' at " + cur.where();
    return ScanStatus::InvalidFormat;
  }
  return stream_end(cur, err);
}

}

ScanStatus locate_events_array(Cursor& cur, std::string& err) {
  QuoteState q;
  int depth = 0;
  std::size_t idx = 0;     // bytes of kEventsKey matched in the current string
  bool matching = false;   // current string is a depth-1 candidate
  bool seen_key = false;   // last string was "events"; waiting for ':'

  char c;
  while (cur.next(c)) {
    const bool was_inside = q.inside;
    if (q.step(c)) {
      if (!was_inside) {
        seen_key = false;
        matching = (depth == 1);
        idx = 0;
      } else {
        seen_key = matching && idx == kEventsKey.size();
      }
      continue;
    }

    if (q.inside) {
      if (matching) {
        if (idx < kEventsKey.size() && c == kEventsKey[idx]) ++idx;
        else matching = false;
      }
      continue;
    }

    if (is_ws(c)) continue;

    if (seen_key && c == ':') {
      if (log::enabled(log::Level::Debug))
        log::write(log::Level::Debug, "feed", "found events key at " + cur.where());
      return open_array(cur, err);
    }
    seen_key = false;

    if (c == '{' || c == '[') ++depth;
    else if (c == '}' || c == ']') --depth;
  }
  return stream_end(cur, err);
}

}
