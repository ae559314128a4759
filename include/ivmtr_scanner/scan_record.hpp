#pragma once
#include <string_view>

namespace ivmtr {

// One extracted element of the "events" array. Both views point into the
// session's arena, are NUL-terminated, and stay valid until the next call to
// FeedSession::next() or close().
struct ScanRecord {
  std::string_view imb;
  std::string_view mail_phase;
};

}
